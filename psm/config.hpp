#pragma once

#include <cstdint>

// =============================================================================
// FILE: psm/config.hpp
// BRIEF: Compile-time configuration (SIMD, threading backend, precision)
// =============================================================================
//
// Set by the build (see CMakeLists.txt), all optional:
//
//   PSM_ONLY_SCALAR                      Highway scalar target only
//   PSM_BACKEND_{OPENMP,TBB,SERIAL}      at most one
//   PSM_PRECISION        0 f32, 1 f64    default 1
//   PSM_INDEX_PRECISION  1 i32, 2 i64    default 2
//
// f64 is the default because bootstrap vote fractions and divergences are
// compared for exact equality across thread counts.
// =============================================================================

#ifdef PSM_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

#if defined(_WIN32) || defined(_WIN64)
    #define PSM_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define PSM_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define PSM_OS_LINUX
#endif

// =============================================================================
// Threading Backend
// =============================================================================

#if !defined(PSM_BACKEND_SERIAL) && !defined(PSM_BACKEND_TBB) && !defined(PSM_BACKEND_OPENMP)
    #if defined(PSM_OS_MAC)
        // Apple clang ships without libomp
        #define PSM_BACKEND_TBB
    #elif defined(PSM_OS_LINUX) || defined(PSM_OS_WINDOWS)
        #define PSM_BACKEND_OPENMP
    #else
        #define PSM_BACKEND_SERIAL
    #endif
#endif

#if (defined(PSM_BACKEND_SERIAL) + defined(PSM_BACKEND_TBB) + defined(PSM_BACKEND_OPENMP)) != 1
    #error "PSM Configuration Error: define exactly one of " \
           "PSM_BACKEND_SERIAL, PSM_BACKEND_TBB, PSM_BACKEND_OPENMP."
#endif

#if defined(PSM_BACKEND_OPENMP)
    #define PSM_USE_OPENMP 1
#elif defined(PSM_BACKEND_TBB)
    #define PSM_USE_TBB 1
#else
    #define PSM_USE_SERIAL 1
#endif

// =============================================================================
// Precision
// =============================================================================

#ifndef PSM_PRECISION
    #define PSM_PRECISION 1
#endif

#if PSM_PRECISION == 0
    #define PSM_USE_FLOAT32
#elif PSM_PRECISION == 1
    #define PSM_USE_FLOAT64
#else
    #error "PSM Configuration Error: PSM_PRECISION must be 0 (f32) or 1 (f64)."
#endif

#ifndef PSM_INDEX_PRECISION
    #define PSM_INDEX_PRECISION 2
#endif

#if PSM_INDEX_PRECISION == 1
    #define PSM_USE_INT32
#elif PSM_INDEX_PRECISION == 2
    #define PSM_USE_INT64
#else
    #error "PSM Configuration Error: PSM_INDEX_PRECISION must be 1 (int32) or 2 (int64)."
#endif
