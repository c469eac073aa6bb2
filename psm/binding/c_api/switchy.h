#pragma once

// =============================================================================
// FILE: psm/binding/c_api/switchy.h
// BRIEF: C API for switchy scores and switchy ordering of events
// =============================================================================
//
// score = (1 - std(sin(pi v))) * (-mean(cos(pi v))), NaN values ignored.
// Near -1 for events concentrated at 0, near +1 at 1.
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Score of one value vector, *defined = PSM_FALSE if every value is NaN
PSM_EXPORT psm_error_t psm_switchy_score(
    const psm_real_t* values,
    psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined
);

PSM_EXPORT psm_error_t psm_switchy_scores(
    psm_dense_t psi,
    psm_real_t* scores,               // Output [n_events], NaN if undefined
    uint8_t* defined,                 // Output [n_events]
    psm_size_t n_events
);

// Event indices sorted ascending by score, stable, undefined events last
PSM_EXPORT psm_error_t psm_switchy_order(
    psm_dense_t psi,
    psm_index_t* order,               // Output [n_events]
    psm_size_t n_events
);

#ifdef __cplusplus
}
#endif
