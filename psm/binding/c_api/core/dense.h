#pragma once

// =============================================================================
// FILE: psm/binding/c_api/core/dense.h
// BRIEF: C API for read-only dense PSI matrix views (row-major layout)
// =============================================================================
//
// A handle is a view of caller memory: rows are samples, columns are
// splicing events, NaN marks a sample without reads. Element (i, j) is
// data[i * stride + j], so a C-contiguous NumPy array wraps with
// stride == cols. Destroying the handle never frees the data, and the data
// must outlive every call that receives the handle.
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// rows > 0, cols > 0, stride >= cols
PSM_EXPORT psm_error_t psm_dense_wrap(
    psm_dense_t* out,
    psm_index_t rows,
    psm_index_t cols,
    const psm_real_t* data,
    psm_index_t stride
);

// Sets *matrix to NULL. Safe on NULL and on an already destroyed handle.
PSM_EXPORT psm_error_t psm_dense_destroy(psm_dense_t* matrix);

PSM_EXPORT psm_error_t psm_dense_rows(psm_dense_t matrix, psm_index_t* out);

PSM_EXPORT psm_error_t psm_dense_cols(psm_dense_t matrix, psm_index_t* out);

PSM_EXPORT psm_error_t psm_dense_stride(psm_dense_t matrix, psm_index_t* out);

PSM_EXPORT psm_error_t psm_dense_size(psm_dense_t matrix, psm_size_t* out);

PSM_EXPORT psm_error_t psm_dense_is_contiguous(psm_dense_t matrix, psm_bool_t* out);

// PSM_ERROR_INDEX_OUT_OF_BOUNDS outside the view
PSM_EXPORT psm_error_t psm_dense_get(
    psm_dense_t matrix,
    psm_index_t row,
    psm_index_t col,
    psm_real_t* out
);

#ifdef __cplusplus
}
#endif
