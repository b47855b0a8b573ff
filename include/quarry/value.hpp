#pragma once

/// @file value.hpp
/// @brief Document tree produced by the tree front-end.
///
/// Value is a recursive sum type over null, bool, Number, string, Array and
/// Object. A tree exclusively owns its children; the parser only appends,
/// so no sharing or cycles are possible.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "number.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace quarry {

class Value {
public:
    Value() noexcept : data_(nullptr) {}
    Value(std::nullptr_t) noexcept : data_(nullptr) {}
    Value(bool v) noexcept : data_(v) {}
    Value(int v) : data_(Number(v)) {}
    Value(int64_t v) : data_(Number(v)) {}
    Value(double v) : data_(Number(v)) {}
    Value(Number v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v ? v : "")) {}
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(Array v) : data_(std::move(v)) {}
    Value(Object v) : data_(std::move(v)) {}

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    // ─── Type queries ────────────────────────────────────────────────────

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }
    [[nodiscard]] bool is_null()   const noexcept { return type() == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return type() == Type::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return type() == Type::Number; }
    [[nodiscard]] bool is_string() const noexcept { return type() == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return type() == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return type() == Type::Object; }

    /// Converts a lazy number to find out.
    [[nodiscard]] bool is_integer() const { return is_number() && as_number().is_integer(); }
    [[nodiscard]] bool is_float() const { return is_number() && as_number().is_float(); }

    // ─── Typed access ────────────────────────────────────────────────────

    bool as_bool() const { return get<bool>(Type::Bool); }
    const Number& as_number() const { return get<Number>(Type::Number); }
    int64_t as_integer() const { return as_number().as_integer(); }
    double as_float() const { return as_number().as_float(); }
    [[nodiscard]] const std::string& as_string() const { return get<std::string>(Type::String); }
    [[nodiscard]] const Array& as_array() const { return get<Array>(Type::Array); }
    [[nodiscard]] Array& as_array() { return get<Array>(Type::Array); }
    [[nodiscard]] const Object& as_object() const { return get<Object>(Type::Object); }
    [[nodiscard]] Object& as_object() { return get<Object>(Type::Object); }

    // ─── Element access ──────────────────────────────────────────────────

    Value& operator[](size_t index) {
        auto& a = as_array();
        if (QUARRY_UNLIKELY(index >= a.size())) throw_index(index, a.size());
        return a[index];
    }
    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (QUARRY_UNLIKELY(index >= a.size())) throw_index(index, a.size());
        return a[index];
    }
    Value& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    /// Mutable key access: a null value becomes an object; missing keys are created.
    Value& operator[](std::string_view key) {
        if (is_null()) data_ = Object{};
        return as_object()[key];
    }
    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    Value& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && as_object().contains(key);
    }
    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? as_object().find(key) : nullptr;
    }
    [[nodiscard]] Value* find(std::string_view key) {
        return is_object() ? as_object().find(key) : nullptr;
    }

    /// Elements of an array or entries of an object; 0 for scalars.
    [[nodiscard]] size_t size() const noexcept {
        if (const auto* a = std::get_if<Array>(&data_)) return a->size();
        if (const auto* o = std::get_if<Object>(&data_)) return o->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // ─── Mutation ────────────────────────────────────────────────────────

    void push_back(Value v) { as_array().push_back(std::move(v)); }

    /// Insert or replace a key (last write wins).
    void insert(std::string key, Value v) { as_object().insert(std::move(key), std::move(v)); }

    // ─── Comparison ──────────────────────────────────────────────────────

    /// Structural equality; numbers by numeric value, objects in order.
    [[nodiscard]] bool operator==(const Value& other) const {
        if (type() != other.type()) return false;
        return data_ == other.data_;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    template <typename T>
    const T& get(Type expected) const {
        const auto* p = std::get_if<T>(&data_);
        if (QUARRY_UNLIKELY(!p)) throw_type(expected);
        return *p;
    }

    template <typename T>
    T& get(Type expected) {
        auto* p = std::get_if<T>(&data_);
        if (QUARRY_UNLIKELY(!p)) throw_type(expected);
        return *p;
    }

    [[noreturn]] QUARRY_NOINLINE void throw_type(Type expected) const {
        throw TypeError(std::string("expected ") + type_name(expected) + ", got " +
                        type_name(type()));
    }

    [[noreturn]] QUARRY_NOINLINE static void throw_index(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size " + std::to_string(size) + ")");
    }

    // Alternative order matches Type.
    std::variant<std::nullptr_t, bool, Number, std::string, Array, Object> data_;
};

// ─── Object member functions ────────────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {}
inline Object::Object(Object&& o) noexcept
    : entries(std::move(o.entries)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries = o.entries; index_.reset(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries = std::move(o.entries); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<entry_type> init) {
    for (const auto& e : init) insert(e.first, e.second);
}

inline void Object::ensure_index() const { if (use_index() && !index_) rebuild_index(); }
inline void Object::rebuild_index() const {
    if (!index_) index_ = std::make_unique<index_type>(entries.size() * 2);
    else index_->clear();
    for (size_type i = 0; i < entries.size(); ++i)
        (*index_)[std::string_view(entries[i].first)] = i;
}

inline Value* Object::find(std::string_view key) noexcept {
    return const_cast<Value*>(static_cast<const Object*>(this)->find(key));
}
inline const Value* Object::find(std::string_view key) const noexcept {
    if (use_index()) {
        ensure_index();
        auto it = index_->find(key);
        return it != index_->end() ? &entries[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

inline Value& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    insert(std::string(key), Value{});
    return entries.back().second;
}
inline const Value& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (QUARRY_UNLIKELY(!p)) {
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"",
                              errc::key_not_found);
    }
    return *p;
}
inline bool Object::insert(std::string key, Value value) {
    if (auto* p = find(key)) {
        *p = std::move(value);
        return false;
    }
    const auto* old_data = entries.data();
    entries.emplace_back(std::move(key), std::move(value));
    if (index_) {
        // Reallocation leaves every string_view key dangling.
        if (entries.data() != old_data) rebuild_index();
        else index_->emplace(std::string_view(entries.back().first), entries.size() - 1);
    }
    return true;
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) {
            entries.erase(it);
            index_.reset();
            return true;
        }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (size_type i = 0; i < entries.size(); ++i) {
        if (entries[i].first != other.entries[i].first ||
            entries[i].second != other.entries[i].second) return false;
    }
    return true;
}

} // namespace quarry
