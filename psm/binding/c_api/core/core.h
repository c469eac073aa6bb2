#pragma once

// =============================================================================
// FILE: psm/binding/c_api/core/core.h
// BRIEF: C ABI for the psm modality estimation engine
// =============================================================================
//
// Every function returns psm_error_t. On failure a message is kept in
// thread-local storage until the next call on the same thread, and a
// successful call clears it.
//
// Handles are opaque. A dense handle borrows caller memory, an estimator
// handle owns its bins and result cache. Outputs are always caller buffers.
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

#ifndef PSM_EXPORT
    #if defined(_MSC_VER)
        #define PSM_EXPORT __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define PSM_EXPORT __attribute__((visibility("default")))
    #else
        #define PSM_EXPORT
    #endif
#endif

#define PSM_C_API_VERSION_MAJOR 1
#define PSM_C_API_VERSION_MINOR 0
#define PSM_C_API_VERSION_PATCH 0

// "MAJOR.MINOR.PATCH"
PSM_EXPORT const char* psm_get_version(void);

// Precision, SIMD target, threading backend and optional features,
// joined by '+', e.g. "float64+int64+avx2+openmp+hdf5"
PSM_EXPORT const char* psm_get_build_config(void);

// =============================================================================
// Handles and Scalars
// =============================================================================

typedef struct psm_dense_matrix psm_dense_matrix;
typedef struct psm_estimator psm_estimator;

typedef psm_dense_matrix* psm_dense_t;
typedef psm_estimator* psm_estimator_t;

// Must match psm::Real and psm::Index for the configured precision
#if defined(PSM_USE_FLOAT32) || (defined(PSM_PRECISION) && PSM_PRECISION == 0)
typedef float psm_real_t;
#define PSM_REAL_TYPE_NAME "float32"
#else
typedef double psm_real_t;
#define PSM_REAL_TYPE_NAME "float64"
#endif

#if defined(PSM_USE_INT32) || (defined(PSM_INDEX_PRECISION) && PSM_INDEX_PRECISION == 1)
typedef int32_t psm_index_t;
#define PSM_INDEX_TYPE_NAME "int32"
#else
typedef int64_t psm_index_t;
#define PSM_INDEX_TYPE_NAME "int64"
#endif

typedef size_t psm_size_t;

typedef int psm_bool_t;
#define PSM_TRUE 1
#define PSM_FALSE 0

// =============================================================================
// Errors
// =============================================================================

// Values match psm::ErrorCode and never change within a major version
typedef int32_t psm_error_t;

#define PSM_OK 0

#define PSM_ERROR_UNKNOWN 1
#define PSM_ERROR_INTERNAL 2
#define PSM_ERROR_OUT_OF_MEMORY 3
#define PSM_ERROR_NULL_POINTER 4

// Bad edges, thresholds, bootstrap settings, capacities
#define PSM_ERROR_INVALID_ARGUMENT 10
// Output length or dataset shape disagrees with the PSI matrix
#define PSM_ERROR_DIMENSION_MISMATCH 11
#define PSM_ERROR_INDEX_OUT_OF_BOUNDS 14

// Dataset element class is not floating point
#define PSM_ERROR_TYPE_ERROR 20

#define PSM_ERROR_IO_ERROR 30
#define PSM_ERROR_FILE_NOT_FOUND 31

// Built without HDF5
#define PSM_ERROR_FEATURE_UNAVAILABLE 41

// "No error" when the last call on this thread succeeded
PSM_EXPORT const char* psm_get_last_error(void);

PSM_EXPORT psm_error_t psm_get_last_error_code(void);

PSM_EXPORT void psm_clear_error(void);

PSM_EXPORT psm_bool_t psm_is_ok(psm_error_t code);
PSM_EXPORT psm_bool_t psm_is_error(psm_error_t code);

// =============================================================================
// Logging
// =============================================================================

// Same order as spdlog::level
#define PSM_LOG_TRACE 0
#define PSM_LOG_DEBUG 1
#define PSM_LOG_INFO 2
#define PSM_LOG_WARN 3
#define PSM_LOG_ERROR 4
#define PSM_LOG_CRITICAL 5
#define PSM_LOG_OFF 6

// Overrides the PSM_LOG_LEVEL environment variable
PSM_EXPORT psm_error_t psm_set_log_level(int32_t level);

#ifdef __cplusplus
}
#endif
