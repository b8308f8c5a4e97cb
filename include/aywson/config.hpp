#pragma once

/// @file config.hpp
/// @brief Configuration macros for the aywson library.
///
/// Controls:
///   - Branch prediction hints
///   - Default nesting limit of the structural parser
///   - Detachment marker for comments that survive property deletion

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define AYWSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define AYWSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define AYWSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define AYWSON_LIKELY(x)   (x)
    #define AYWSON_UNLIKELY(x) (x)
    #define AYWSON_NOINLINE    __declspec(noinline)
#else
    #define AYWSON_LIKELY(x)   (x)
    #define AYWSON_UNLIKELY(x) (x)
    #define AYWSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Used when ParseOptions::max_depth is 0.

#if !defined(AYWSON_MAX_DEPTH)
    #define AYWSON_MAX_DEPTH 512
#endif

// =====================================================================
// Detached comment marker
// =====================================================================
// A comment whose trimmed content starts with this marker is never
// deleted together with the property it documents.

#if !defined(AYWSON_DETACH_MARKER)
    #define AYWSON_DETACH_MARKER "**"
#endif
