#pragma once

// =============================================================================
// FILE: psm/binding/c_api/binning.h
// BRIEF: C API for discretizing PSI values into bins
// =============================================================================
//
// Edges e0 < ... < ek give k bins: [e0, e1], (e1, e2], ..., (e_{k-1}, ek].
// With close_last_bin the last bin is [e_{k-1}, ek], the convention of the
// modality estimator. NaN and out-of-range values fall in no bin.
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// PSM_OK if edges are finite and strictly increasing (n_edges >= 2)
PSM_EXPORT psm_error_t psm_binning_validate_edges(
    const psm_real_t* edges,
    psm_size_t n_edges
);

// Bin of a single value, *defined = PSM_FALSE (bin = -1) if it falls in none
PSM_EXPORT psm_error_t psm_binning_bin_index(
    psm_real_t value,
    const psm_real_t* edges,
    psm_size_t n_edges,
    psm_bool_t close_last_bin,
    psm_index_t* bin_out,
    psm_bool_t* defined
);

// Per-event bin fractions of a PSI matrix
PSM_EXPORT psm_error_t psm_binning_binify(
    psm_dense_t psi,
    const psm_real_t* edges,
    psm_size_t n_edges,
    psm_bool_t close_last_bin,
    psm_real_t* fractions,            // Output [(n_edges - 1) * n_events], row-major
    uint8_t* defined,                 // Output [n_events], 0 = no in-range value
    psm_size_t n_events
);

// Non-missing values per event
PSM_EXPORT psm_error_t psm_binning_count_present(
    psm_dense_t psi,
    psm_index_t* counts,              // Output [n_events]
    psm_size_t n_events
);

#ifdef __cplusplus
}
#endif
