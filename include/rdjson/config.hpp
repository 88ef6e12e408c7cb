#pragma once

/// @file config.hpp
/// @brief Configuration macros for rdjson.
///
/// Controls:
///   - Branch prediction hints
///   - Default recursion depth limit

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define RDJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define RDJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define RDJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define RDJSON_LIKELY(x)   (x)
    #define RDJSON_UNLIKELY(x) (x)
    #define RDJSON_NOINLINE    __declspec(noinline)
#else
    #define RDJSON_LIKELY(x)   (x)
    #define RDJSON_UNLIKELY(x) (x)
    #define RDJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit
// =====================================================================
// 0 means nesting is bounded only by the call stack.
// Define a positive value to reject deeper documents by default.

#if !defined(RDJSON_MAX_DEPTH)
    #define RDJSON_MAX_DEPTH 0
#endif
