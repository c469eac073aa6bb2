#pragma once

#include "psm/config.hpp"

// =============================================================================
// FILE: psm/core/macros.hpp
// BRIEF: Compiler hints and symbol visibility
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define PSM_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define PSM_UNLIKELY(x) (__builtin_expect(!!(x), 0))
    #define PSM_FORCE_INLINE inline __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define PSM_LIKELY(x)   (x)
    #define PSM_UNLIKELY(x) (x)
    #define PSM_FORCE_INLINE __forceinline
#else
    #define PSM_LIKELY(x)   (x)
    #define PSM_UNLIKELY(x) (x)
    #define PSM_FORCE_INLINE inline
#endif

// Same definition as the C header, whichever is seen first wins
#ifndef PSM_EXPORT
    #if defined(_MSC_VER)
        #define PSM_EXPORT __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define PSM_EXPORT __attribute__((visibility("default")))
    #else
        #define PSM_EXPORT
    #endif
#endif
