#pragma once

/// @file json_pointer.hpp
/// @brief JSON Pointer (RFC 6901) paths.
///
/// Used two ways:
///   - by the event front-end, which keeps one pointer as the path of the
///     value currently being parsed (push on entry, pop on exit)
///   - by callers, to address values inside a parsed tree
///
///   ""       -> root document
///   "/foo/0" -> first element of array "foo"
///   "/a~1b"  -> key "a/b" (~0 = ~, ~1 = /)

#include "error.hpp"
#include "value.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry {

class JsonPointer {
public:
    /// Empty pointer (references the root document).
    JsonPointer() = default;

    /// Parse RFC 6901 text. Throws OutOfRangeError (invalid_pointer).
    explicit JsonPointer(std::string_view text) {
        if (text.empty()) return;
        if (text[0] != '/') {
            throw OutOfRangeError("JSON pointer must start with '/' or be empty",
                                  errc::invalid_pointer);
        }
        text.remove_prefix(1);
        for (;;) {
            const auto pos = text.find('/');
            tokens_.push_back(unescape(text.substr(0, pos)));
            if (pos == std::string_view::npos) break;
            text.remove_prefix(pos + 1);
        }
    }

    // ─── Path building ───────────────────────────────────────────────────

    void push(std::string key) { tokens_.push_back(std::move(key)); }
    void push(size_t index) { tokens_.push_back(std::to_string(index)); }

    /// Drop the last token. No-op on the root pointer.
    void pop() noexcept {
        if (!tokens_.empty()) tokens_.pop_back();
    }

    /// Replace the last token (next array element, next object key).
    void replace_back(std::string token) { tokens_.back() = std::move(token); }

    [[nodiscard]] JsonPointer append(std::string_view token) const {
        JsonPointer p(*this);
        p.push(std::string(token));
        return p;
    }

    [[nodiscard]] JsonPointer append(size_t index) const {
        JsonPointer p(*this);
        p.push(index);
        return p;
    }

    [[nodiscard]] JsonPointer parent() const {
        JsonPointer p(*this);
        p.pop();
        return p;
    }

    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return tokens_.size(); }
    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }

    /// Serialize back to RFC 6901 text.
    [[nodiscard]] std::string to_string() const {
        std::string out;
        for (const auto& tok : tokens_) {
            out += '/';
            escape_into(tok, out);
        }
        return out;
    }

    // ─── Resolution ──────────────────────────────────────────────────────

    /// Throws OutOfRangeError on a missing key/index, TypeError when a
    /// scalar is traversed.
    const Value& resolve(const Value& root) const {
        const Value* cur = &root;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            const auto& tok = tokens_[i];
            if (cur->is_object()) {
                const Value* p = cur->find(tok);
                if (!p) {
                    throw OutOfRangeError("JSON pointer: key not found \"" + tok +
                                          "\" at depth " + std::to_string(i),
                                          errc::key_not_found);
                }
                cur = p;
            } else if (cur->is_array()) {
                const auto& arr = cur->as_array();
                cur = &arr[parse_index(tok, arr.size())];
            } else {
                throw TypeError("JSON pointer: cannot index into " +
                                std::string(type_name(cur->type())) +
                                " at depth " + std::to_string(i));
            }
        }
        return *cur;
    }

    Value& resolve(Value& root) const {
        return const_cast<Value&>(resolve(static_cast<const Value&>(root)));
    }

    /// Returns nullptr if the path does not exist.
    const Value* try_resolve(const Value& root) const noexcept {
        const Value* cur = &root;
        for (const auto& tok : tokens_) {
            if (cur->is_object()) {
                cur = cur->find(tok);
                if (!cur) return nullptr;
            } else if (cur->is_array()) {
                const auto& arr = cur->as_array();
                size_t idx = 0;
                if (!to_index(tok, idx) || idx >= arr.size()) return nullptr;
                cur = &arr[idx];
            } else {
                return nullptr;
            }
        }
        return cur;
    }

    Value* try_resolve(Value& root) const noexcept {
        return const_cast<Value*>(try_resolve(static_cast<const Value&>(root)));
    }

    bool operator==(const JsonPointer& o) const { return tokens_ == o.tokens_; }
    bool operator!=(const JsonPointer& o) const { return tokens_ != o.tokens_; }

private:
    /// ~1 -> /, ~0 -> ~; any other '~' is malformed.
    static std::string unescape(std::string_view sv) {
        std::string out;
        out.reserve(sv.size());
        for (size_t i = 0; i < sv.size(); ++i) {
            if (sv[i] != '~') {
                out += sv[i];
                continue;
            }
            const char n = i + 1 < sv.size() ? sv[i + 1] : '\0';
            if (n == '0') out += '~';
            else if (n == '1') out += '/';
            else {
                throw OutOfRangeError("JSON pointer: invalid escape in \"" +
                                      std::string(sv) + "\"", errc::invalid_pointer);
            }
            ++i;
        }
        return out;
    }

    static void escape_into(std::string_view s, std::string& out) {
        for (char c : s) {
            if (c == '~') out += "~0";
            else if (c == '/') out += "~1";
            else out += c;
        }
    }

    /// Decimal index without leading zeros.
    static bool to_index(std::string_view tok, size_t& idx) noexcept {
        if (tok.empty() || (tok.size() > 1 && tok[0] == '0')) return false;
        auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), idx);
        return ec == std::errc{} && p == tok.data() + tok.size();
    }

    static size_t parse_index(std::string_view tok, size_t size) {
        size_t idx = 0;
        if (!to_index(tok, idx)) {
            throw OutOfRangeError("JSON pointer: invalid array index \"" +
                                  std::string(tok) + "\"", errc::invalid_pointer);
        }
        if (idx >= size) {
            throw OutOfRangeError("JSON pointer: array index " + std::to_string(idx) +
                                  " >= size " + std::to_string(size));
        }
        return idx;
    }

    std::vector<std::string> tokens_;
};

/// Resolve pointer text against a value.
inline const Value& resolve(const Value& root, std::string_view pointer) {
    return JsonPointer(pointer).resolve(root);
}

inline Value& resolve(Value& root, std::string_view pointer) {
    return JsonPointer(pointer).resolve(root);
}

} // namespace quarry
