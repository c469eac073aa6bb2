#pragma once

// =============================================================================
// FILE: psm/binding/c_api/io.h
// BRIEF: C API for PSI matrices and assignments stored in HDF5 files
// =============================================================================
//
// Available when the library is built with HDF5, otherwise every function
// returns PSM_ERROR_FEATURE_UNAVAILABLE.
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Shape of a 2-D floating-point dataset (samples x events)
PSM_EXPORT psm_error_t psm_io_psi_shape(
    const char* path,
    const char* dataset,
    psm_index_t* rows,
    psm_index_t* cols
);

// Read into a caller buffer of rows * cols values (row-major)
PSM_EXPORT psm_error_t psm_io_read_psi(
    const char* path,
    const char* dataset,
    psm_real_t* out,
    psm_size_t capacity
);

// Create or truncate path and write psi as a 2-D dataset
PSM_EXPORT psm_error_t psm_io_write_psi(
    const char* path,
    const char* dataset,
    psm_dense_t psi
);

// Write int8 modality codes, adding to path if it already exists
PSM_EXPORT psm_error_t psm_io_write_assignments(
    const char* path,
    const char* dataset,
    const int8_t* codes,
    psm_size_t n_events
);

// n_events must match the stored length
PSM_EXPORT psm_error_t psm_io_read_assignments(
    const char* path,
    const char* dataset,
    int8_t* codes,
    psm_size_t n_events
);

#ifdef __cplusplus
}
#endif
