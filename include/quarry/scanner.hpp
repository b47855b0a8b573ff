#pragma once

/// @file scanner.hpp
/// @brief Character-level navigation over a decoder.
///
/// The scanner keeps two explicit sequences of positioned characters:
///   - the scan buffer: characters advanced over but not yet taken; its
///     content is always the text of the token being assembled
///   - the pushback buffer: characters returned to the front of the input;
///     drained (most recent first) before anything new is decoded
/// plus a single lookahead slot for a decoded character that has been
/// peeked but not advanced over. There is never more than one lookahead.

#include "config.hpp"
#include "decoder.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

/// @brief A decoded character and its position in the input.
struct CharUnit {
    char32_t ch = 0;
    Coordinate coordinate;

    bool operator==(const CharUnit& o) const noexcept {
        return ch == o.ch && coordinate == o.coordinate;
    }
    bool operator!=(const CharUnit& o) const noexcept { return !(*this == o); }
};

/// @brief Text of a taken scan buffer plus the coordinates of its first
/// and last characters.
struct TextSpan {
    std::string text;
    Coordinate start;
    Coordinate end;
};

class Scanner {
public:
    explicit Scanner(Decoder& decoder) : decoder_(decoder) {
        buffer_.reserve(64);
    }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // ─── Navigation ──────────────────────────────────────────────────────

    /// @brief Move one character into the scan buffer.
    ///
    /// Sources, in order: the pushback buffer, the lookahead slot, the
    /// decoder.
    /// @throws ScanError (end_of_input) when the input is exhausted.
    /// @throws DecodeError when the decoder fails.
    void advance() {
        if (!pushbacks_.empty()) {
            buffer_.push_back(pushbacks_.back());
            pushbacks_.pop_back();
        } else if (lookahead_) {
            buffer_.push_back(*lookahead_);
            lookahead_.reset();
        } else {
            CharUnit unit;
            if (QUARRY_UNLIKELY(!pull(unit))) {
                throw ScanError("end of input reached", next_, errc::end_of_input);
            }
            buffer_.push_back(unit);
        }
        current_ = buffer_.back().coordinate;
    }

    /// @brief Advance n times.
    void advance_n(size_t n) {
        for (size_t i = 0; i < n; ++i) advance();
    }

    /// @brief Return the most recently advanced character to the input.
    /// @throws ScanError (pushback_underflow) if the scan buffer is empty.
    void pushback() {
        if (QUARRY_UNLIKELY(buffer_.empty())) {
            throw ScanError("pushback with an empty scan buffer", current_,
                            errc::pushback_underflow);
        }
        pushbacks_.push_back(buffer_.back());
        buffer_.pop_back();
        current_ = buffer_.empty() ? anchor_ : buffer_.back().coordinate;
    }

    /// @brief Peek at the next character without consuming it.
    ///
    /// Repeated calls without an intervening advance() return the same unit.
    /// @return nullptr at end of input.
    /// @throws DecodeError when the decoder fails.
    const CharUnit* lookahead() {
        if (!pushbacks_.empty()) return &pushbacks_.back();
        if (!lookahead_) {
            CharUnit unit;
            if (!pull(unit)) return nullptr;
            lookahead_ = unit;
        }
        return &*lookahead_;
    }

    // ─── Buffer access ───────────────────────────────────────────────────

    /// @brief Take the scan buffer as text and clear it (token boundary).
    ///
    /// An empty buffer yields empty text positioned at next_coordinate().
    TextSpan take() {
        TextSpan span;
        if (buffer_.empty()) {
            span.start = span.end = next_coordinate();
        } else {
            span.start = buffer_.front().coordinate;
            span.end = buffer_.back().coordinate;
            span.text.reserve(buffer_.size());
            for (const auto& unit : buffer_) {
                detail::utf8::encode(static_cast<uint32_t>(unit.ch), span.text);
            }
        }
        clear();
        return span;
    }

    /// @brief Drop the scan buffer without producing text.
    void clear() noexcept {
        buffer_.clear();
        anchor_ = current_;
    }

    /// @brief Most recently advanced character (end of the scan buffer).
    /// @throws ScanError (pushback_underflow) if the scan buffer is empty.
    [[nodiscard]] const CharUnit& last() const {
        if (QUARRY_UNLIKELY(buffer_.empty())) {
            throw ScanError("scan buffer is empty", current_, errc::pushback_underflow);
        }
        return buffer_.back();
    }

    /// @brief Oldest character of the scan buffer (start of the token).
    /// @throws ScanError (pushback_underflow) if the scan buffer is empty.
    [[nodiscard]] const CharUnit& first() const {
        if (QUARRY_UNLIKELY(buffer_.empty())) {
            throw ScanError("scan buffer is empty", current_, errc::pushback_underflow);
        }
        return buffer_.front();
    }

    [[nodiscard]] const std::vector<CharUnit>& buffer() const noexcept { return buffer_; }
    [[nodiscard]] size_t buffer_size() const noexcept { return buffer_.size(); }
    [[nodiscard]] size_t pending_pushbacks() const noexcept { return pushbacks_.size(); }

    // ─── Coordinates ─────────────────────────────────────────────────────

    /// @brief Coordinate of the most recently advanced character, or the
    /// start-of-input coordinate before the first advance.
    [[nodiscard]] Coordinate current_coordinate() const noexcept { return current_; }

    /// @brief Coordinate the next advanced character will have.
    [[nodiscard]] Coordinate next_coordinate() const noexcept {
        if (!pushbacks_.empty()) return pushbacks_.back().coordinate;
        if (lookahead_) return lookahead_->coordinate;
        return next_;
    }

    // ─── Faults ──────────────────────────────────────────────────────────

    /// @brief Raise a lexical fault at the most recently advanced character.
    [[noreturn]] QUARRY_NOINLINE void fail(const std::string& message, errc code) const {
        throw LexError(message, current_, code);
    }

    /// @brief Raise a lexical fault at the character that would come next
    /// (end-of-input conditions).
    [[noreturn]] QUARRY_NOINLINE void fail_ahead(const std::string& message, errc code) const {
        throw LexError(message, next_coordinate(), code);
    }

private:
    /// Decode one character and stamp it with the next fresh coordinate.
    bool pull(CharUnit& unit) {
        char32_t ch = 0;
        if (!decoder_.next(ch)) return false;
        unit.ch = ch;
        unit.coordinate = next_;
        ++next_.offset;
        if (ch == U'\n') {
            ++next_.line;
            next_.column = 1;
        } else {
            ++next_.column;
        }
        return true;
    }

    Decoder& decoder_;
    std::vector<CharUnit> buffer_;
    std::vector<CharUnit> pushbacks_;
    std::optional<CharUnit> lookahead_;
    Coordinate next_;     ///< position of the next freshly decoded character
    Coordinate current_;  ///< position of the most recently advanced character
    Coordinate anchor_;   ///< current_ at the moment the buffer was last emptied
};

} // namespace quarry
