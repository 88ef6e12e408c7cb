#pragma once

/// @file value.hpp
/// @brief Library core. Value is a tagged union over the six JSON types.
///
/// Implementation:
///   - Kind tag + union payload; strings, arrays and objects live on the heap
///   - Manual resource management (copy/move/destroy)
///   - Read-only public interface: a parsed tree is never mutated in place
///   - Every dispatch on the kind is an exhaustive switch without default,
///     so a new Type enumerator is reported by -Wswitch at every consumer

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rdjson {

class Value {
public:
    Value() noexcept : kind_(Type::Null) { u_.d = 0.0; }
    Value(std::nullptr_t) noexcept : kind_(Type::Null) { u_.d = 0.0; }
    Value(bool v) noexcept : kind_(Type::Bool) { u_.d = 0.0; u_.b = v; }
    Value(double v) noexcept : kind_(Type::Number) { u_.d = v; }
    Value(int v) noexcept : kind_(Type::Number) { u_.d = static_cast<double>(v); }
    Value(const char* v) : kind_(Type::Null) {
        u_.d = 0.0;
        if (RDJSON_UNLIKELY(!v)) return;
        u_.str = new std::string(v);
        kind_ = Type::String;
    }
    Value(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }
    Value(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Value(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Value(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Value(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Value(const Value& o) : kind_(o.kind_) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Type::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Type::Object; }

    bool as_bool() const {
        if (RDJSON_UNLIKELY(!is_bool())) type_mismatch("bool");
        return u_.b;
    }
    double as_number() const {
        if (RDJSON_UNLIKELY(!is_number())) type_mismatch("number");
        return u_.d;
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (RDJSON_UNLIKELY(!is_string())) type_mismatch("string");
        return *u_.str;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (RDJSON_UNLIKELY(!is_string())) type_mismatch("string");
        return *u_.str;
    }
    [[nodiscard]] const Array& as_array() const {
        if (RDJSON_UNLIKELY(!is_array())) type_mismatch("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (RDJSON_UNLIKELY(!is_object())) type_mismatch("object");
        return *u_.obj;
    }

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, bool>) return as_bool();
        else if constexpr (std::is_arithmetic_v<T>) {
            const double d = as_number();
            if (RDJSON_UNLIKELY(!number_fits<T>(d)))
                throw OutOfRangeError("number does not fit the requested arithmetic type");
            return static_cast<T>(d);
        }
        else if constexpr (std::is_same_v<T, std::string>) return as_string();
        else if constexpr (std::is_same_v<T, std::string_view>) return as_string_view();
        else static_assert(sizeof(T) == 0, "Unsupported type for get<T>()");
    }
    /// Type-safe value access with fallback, never throws.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? u_.b : dv;
        } else if constexpr (std::is_arithmetic_v<T>) {
            return is_number() && number_fits<T>(u_.d) ? static_cast<T>(u_.d) : dv;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return is_string() ? *u_.str : dv;
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return is_string() ? std::string_view(*u_.str) : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (RDJSON_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }
    const Value& operator[](const std::string& key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /// @brief Call @p f with the payload of the active variant.
    ///
    /// The visitor must accept std::nullptr_t, bool, double, std::string_view,
    /// const Array& and const Object&, and return the same type for all six.
    template <typename F>
    decltype(auto) visit(F&& f) const {
        switch (kind_) {
            case Type::Null:   return f(nullptr);
            case Type::Bool:   return f(u_.b);
            case Type::Number: return f(u_.d);
            case Type::String: return f(std::string_view(*u_.str));
            case Type::Array:  return f(static_cast<const Array&>(*u_.arr));
            case Type::Object: return f(static_cast<const Object&>(*u_.obj));
        }
        return f(nullptr);
    }

    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type kind_;
    union Payload {
        bool b;
        double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    [[noreturn]] RDJSON_NOINLINE void type_mismatch(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    /// True when static_cast<T>(d) is defined. NaN never fits an integer.
    template <typename T>
    static bool number_fits(double d) noexcept {
        if constexpr (std::is_integral_v<T>) {
            if (std::isnan(d)) return false;
            const double bound = std::ldexp(1.0, std::numeric_limits<T>::digits);
            if constexpr (std::is_signed_v<T>) return d >= -bound && d < bound;
            else return d > -1.0 && d < bound;
        } else {
            return !std::isfinite(d) ||
                   (d >= static_cast<double>(std::numeric_limits<T>::lowest()) &&
                    d <= static_cast<double>(std::numeric_limits<T>::max()));
        }
    }

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::Null:
            case Type::Bool:
            case Type::Number:
                u_ = o.u_;
                break;
            case Type::String:
                u_.str = new std::string(*o.u_.str);
                break;
            case Type::Array:
                u_.arr = new Array(*o.u_.arr);
                break;
            case Type::Object:
                u_.obj = new Object(*o.u_.obj);
                break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::Null:
            case Type::Bool:
            case Type::Number:
                break;
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
        }
    }
};

// ─── Value out-of-line members ───────────────────────────────────────────

inline size_t Value::size() const noexcept {
    if (is_array())  return u_.arr->size();
    if (is_object()) return u_.obj->size();
    return 0;
}

inline bool Value::empty() const noexcept {
    if (is_null()) return true;
    if (is_array())  return u_.arr->empty();
    if (is_object()) return u_.obj->empty();
    return false;
}

inline bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Type::Null:   return true;
        case Type::Bool:   return u_.b == other.u_.b;
        case Type::Number: return u_.d == other.u_.d;
        case Type::String: return *u_.str == *other.u_.str;
        case Type::Array:  return *u_.arr == *other.u_.arr;
        case Type::Object: return *u_.obj == *other.u_.obj;
    }
    return false;
}

// ─── Object special member functions ─────────────────────────────────────

inline Object::Object() = default;
inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries_(o.entries_) {
    if (o.index_) rebuild_index();
}
inline Object::Object(Object&&) noexcept = default;
inline Object& Object::operator=(const Object& o) {
    if (this != &o) {
        entries_ = o.entries_;
        if (o.index_) rebuild_index();
        else index_.reset();
    }
    return *this;
}
inline Object& Object::operator=(Object&&) noexcept = default;

inline Object::Object(std::initializer_list<std::pair<std::string, Value>> init) {
    entries_.reserve(init.size());
    for (const auto& [k, v] : init) insert(k, v);
}

inline bool Object::empty() const noexcept { return entries_.empty(); }
inline Object::size_type Object::size() const noexcept { return entries_.size(); }
inline void Object::reserve(size_type n) {
    const auto* old_data = entries_.data();
    entries_.reserve(n);
    if (index_ && entries_.data() != old_data) rebuild_index();
}

inline Object::storage_type::const_iterator Object::begin() const noexcept {
    return entries_.begin();
}
inline Object::storage_type::const_iterator Object::end() const noexcept {
    return entries_.end();
}

inline const Value* Object::find(std::string_view key) const noexcept {
    if (index_) {
        auto it = index_->find(key);
        return it != index_->end() ? &entries_[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries_) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline const Value& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (RDJSON_UNLIKELY(!p))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"", errc::key_not_found);
    return *p;
}
inline void Object::insert(std::string key, Value value) {
    if (!index_) {
        for (auto& [k, v] : entries_) {
            if (k == key) { v = std::move(value); return; }
        }
        entries_.emplace_back(std::move(key), std::move(value));
        if (entries_.size() >= kIndexThreshold) rebuild_index();
        return;
    }

    auto it = index_->find(std::string_view(key));
    if (it != index_->end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    const auto* old_data = entries_.data();
    entries_.emplace_back(std::move(key), std::move(value));
    if (entries_.data() != old_data) {
        // Reallocation moved every key, so all views are dangling.
        rebuild_index();
    } else {
        index_->emplace(std::string_view(entries_.back().first), entries_.size() - 1);
    }
}
inline void Object::rebuild_index() {
    if (!index_) index_ = std::make_unique<index_type>(entries_.size() * 2);
    else index_->clear();
    for (size_type i = 0; i < entries_.size(); ++i)
        index_->emplace(std::string_view(entries_[i].first), i);
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    // Key order does not matter for semantic comparison of JSON objects.
    for (const auto& [key, val] : entries_) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace rdjson
