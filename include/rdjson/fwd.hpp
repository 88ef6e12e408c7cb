#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for rdjson.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rdjson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;

/// JSON value types
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

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<Value>;

/// @brief JSON object: key-value pairs with unique keys.
///
/// Entries keep insertion order for iteration, but equality ignores order.
/// insert() on an existing key replaces its value (last write wins).
///
/// Small objects are searched linearly. Once an object holds
/// kIndexThreshold entries, insert() builds a hash index (key -> offset in
/// entries_) and keeps it in sync, so lookups stay O(1) on large objects.
/// The index is never created from a const member, which keeps concurrent
/// reads of a shared tree free of writes.
struct Object {
    using storage_type = std::vector<std::pair<std::string, Value>>;
    using size_type = size_t;
    /// Views point into entries_[i].first; rebuilt whenever entries_ reallocates.
    using index_type = std::unordered_map<std::string_view, size_type>;

    static constexpr size_type kIndexThreshold = 16;

    // ─── Constructors (defined in value.hpp) ─────────────────────────

    Object();
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}
    /// Later duplicates replace earlier ones.
    Object(std::initializer_list<std::pair<std::string, Value>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept;
    size_type size() const noexcept;
    void reserve(size_type n);

    // ─── Iterators ──────────────────────────────────────────────────────
    storage_type::const_iterator begin() const noexcept;
    storage_type::const_iterator end() const noexcept;

    // ─── Lookup ─────────────────────────────────────────────────────────
    const Value* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Throws OutOfRangeError if the key is absent.
    const Value& at(std::string_view key) const;

    // ─── Modification ───────────────────────────────────────────────────

    /// Insert a key-value pair or overwrite the value of an existing key.
    void insert(std::string key, Value value);

    /// Comparison (order-insensitive).
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

    const storage_type& storage() const noexcept { return entries_; }

private:
    storage_type entries_;
    std::unique_ptr<index_type> index_;

    void rebuild_index();
};

} // namespace rdjson
