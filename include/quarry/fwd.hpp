#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and container types of the document tree.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quarry {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class Number;
class Lexer;
struct Token;

/// Document value types
enum class Type : uint8_t {
    Null   = 0,
    Bool   = 1,
    Number = 2,
    String = 3,
    Array  = 4,
    Object = 5
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

// ─── Container types ────────────────────────────────────────────────────

/// Ordered sequence of values.
using Array = std::vector<Value>;

/// @brief Ordered mapping from string key to value.
///
/// Keys keep their first insertion position; inserting an existing key
/// replaces its value (last write wins). Lookup is linear for small objects
/// and goes through a lazily built hash index above kIndexThreshold entries.
/// Because const lookups may build that index (and lazy numbers cache their
/// conversion), a tree shared between threads needs external locking.
struct Object {
    using entry_type = std::pair<std::string, Value>;
    using storage_type = std::vector<entry_type>;
    using size_type = size_t;
    /// Index keys are string_views into entries[].first; rebuilt whenever
    /// the entries vector reallocates or shifts.
    using index_type = std::unordered_map<std::string_view, size_type>;

    storage_type entries;

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<entry_type> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin()  const noexcept { return entries.begin(); }
    auto end()    const noexcept { return entries.end(); }

    // ─── Lookup and mutation (defined in value.hpp) ─────────────────────

    Value* find(std::string_view key) noexcept;
    const Value* find(std::string_view key) const noexcept;

    bool contains(std::string_view key) const noexcept;

    /// Access or create an element by key.
    Value& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const Value& at(std::string_view key) const;

    /// Insert or replace. Returns true if the key was new.
    bool insert(std::string key, Value value);

    bool erase(std::string_view key);

    void clear() noexcept {
        entries.clear();
        index_.reset();
    }

    /// Ordered comparison: same keys, same values, same order.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    static constexpr size_type kIndexThreshold = 16;

    bool use_index() const noexcept { return entries.size() >= kIndexThreshold; }
    void ensure_index() const;
    void rebuild_index() const;

    mutable std::unique_ptr<index_type> index_;
};

} // namespace quarry
