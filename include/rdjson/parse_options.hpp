#pragma once

/// @file parse_options.hpp
/// @brief Parser configuration.
///
/// Available switches:
///   - Nesting depth limit
///   - Trailing commas in arrays and objects
///   - Number inference for quoted strings

#include <cstddef>

namespace rdjson {

/// @brief Parser configuration.
struct ParseOptions {
    /// Maximum nesting depth (0 = use RDJSON_MAX_DEPTH from config.hpp,
    /// which itself defaults to 0 = unlimited)
    size_t max_depth = 0;

    /// Allow trailing commas: [1,2,3,] and {"a":1,"b":2,}
    bool allow_trailing_commas = false;

    /// Treat any scalar token whose text converts to a finite double as a
    /// Number, quoted or not: "42" parses as 42. When false, quoted text
    /// always stays a String and an unquoted run that does not convert is
    /// rejected with errc::invalid_number.
    bool infer_quoted_numbers = true;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Quoted strings stay strings, no trailing commas.
    static constexpr ParseOptions strict() noexcept {
        ParseOptions opts;
        opts.infer_quoted_numbers = false;
        return opts;
    }

    /// Trailing commas accepted, numbers inferred from any scalar text.
    static constexpr ParseOptions lenient() noexcept {
        ParseOptions opts;
        opts.allow_trailing_commas = true;
        return opts;
    }
};

} // namespace rdjson
