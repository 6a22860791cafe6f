#pragma once

/// @file config.hpp
/// @brief Compile-time knobs for ordmap.
///
/// Every macro below may be predefined by the build to override the default.

// =====================================================================
// Compiler hints
// =====================================================================
// GCC and Clang get branch weights, a no-inline marker for cold error paths
// and printf format checking for the log entry point. Other compilers see
// no-op spellings.

#if defined(__GNUC__) || defined(__clang__)
    #define ORDMAP_HAS_GNU_ATTRIBUTES 1
#else
    #define ORDMAP_HAS_GNU_ATTRIBUTES 0
#endif

#if ORDMAP_HAS_GNU_ATTRIBUTES
    #define ORDMAP_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define ORDMAP_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define ORDMAP_NOINLINE    __attribute__((noinline))
    #define ORDMAP_PRINTF_FORMAT(fmt_idx, args_idx) \
        __attribute__((format(printf, fmt_idx, args_idx)))
#else
    #define ORDMAP_LIKELY(x)   (x)
    #define ORDMAP_UNLIKELY(x) (x)
    #if defined(_MSC_VER)
        #define ORDMAP_NOINLINE __declspec(noinline)
    #else
        #define ORDMAP_NOINLINE
    #endif
    #define ORDMAP_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

// =====================================================================
// Reader nesting limit
// =====================================================================
// A record value may itself hold maps, arrays and objects. The reader
// recurses once per level, so the limit bounds its stack use.

#ifndef ORDMAP_MAX_DEPTH
    #define ORDMAP_MAX_DEPTH 512
#endif

// =====================================================================
// Initial log threshold
// =====================================================================
// 0 = debug, 1 = info, 2 = warn, 3 = error. set_log_level() overrides it
// at run time.

#ifndef ORDMAP_DEFAULT_LOG_LEVEL
    #define ORDMAP_DEFAULT_LOG_LEVEL 1
#endif
