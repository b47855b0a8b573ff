#pragma once

/// @file config.hpp
/// @brief Configuration macros for the quarry pipeline.
///
/// Controls:
///   - Branch prediction hints
///   - Platform detection (memory-mapped file sources)
///   - Nesting depth limit

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define QUARRY_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define QUARRY_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define QUARRY_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define QUARRY_LIKELY(x)   (x)
    #define QUARRY_UNLIKELY(x) (x)
    #define QUARRY_NOINLINE    __declspec(noinline)
#else
    #define QUARRY_LIKELY(x)   (x)
    #define QUARRY_UNLIKELY(x) (x)
    #define QUARRY_NOINLINE
#endif

// =====================================================================
// Platform detection
// =====================================================================

#if !defined(QUARRY_NO_MMAP)
    #if defined(__unix__) || defined(__APPLE__)
        #define QUARRY_HAS_MMAP 1
    #endif
#endif

// =====================================================================
// Recursion depth limit
// =====================================================================
// The parser keeps an explicit frame stack, so this bounds memory rather
// than the call stack. Override per parse with ParseOptions::max_depth.

#if !defined(QUARRY_MAX_DEPTH)
    #define QUARRY_MAX_DEPTH 512
#endif

// =====================================================================
// Stream read chunk size (non-mmap sources)
// =====================================================================

#if !defined(QUARRY_STREAM_CHUNK)
    #define QUARRY_STREAM_CHUNK 65536
#endif
