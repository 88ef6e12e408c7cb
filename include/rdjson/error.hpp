#pragma once

/// @file error.hpp
/// @brief Error types for rdjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError (default)
///   - Via error_code: rdjson::errc enum + json_category() (exception-free)
///
/// Use try_parse(input) for exception-free parsing.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace rdjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief JSON error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    malformed_literal       = 3,
    unterminated_string     = 4,
    expected_separator      = 5,
    expected_string_key     = 6,
    unexpected_token        = 7,
    unterminated_array      = 8,
    unterminated_object     = 9,
    invalid_number          = 10,
    trailing_content        = 11,
    max_depth_exceeded      = 12,

    // Value access errors (50-79)
    type_mismatch           = 50,
    out_of_range            = 51,
    key_not_found           = 52,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "rdjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::malformed_literal:       return "malformed literal";
            case errc::unterminated_string:     return "unterminated string";
            case errc::expected_separator:      return "expected ':' separator";
            case errc::expected_string_key:     return "object key must be a string";
            case errc::unexpected_token:        return "unexpected token";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::invalid_number:          return "invalid number";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "value out of range";
            case errc::key_not_found:           return "key not found";
        }
        return "unknown json error";
    }
};

} // namespace detail

/// @brief Get the json error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from rdjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON parse error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg, errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code + where it happened.
/// Usage: auto res = rdjson::try_parse(input); if (!res) report(res.ec);
template <typename T>
struct result {
    T value;
    std::error_code ec;
    SourceLocation location;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace rdjson

// Register rdjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<rdjson::errc> : true_type {};
} // namespace std
