#pragma once

// =============================================================================
// FILE: psm/binding/c_api/divergence.h
// BRIEF: C API for Jensen-Shannon divergence (natural log)
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Jensen-Shannon divergence, inputs normalized to unit mass.
// *defined = PSM_FALSE (and *out = NaN) when either input has zero mass
// or a negative / non-finite entry.
PSM_EXPORT psm_error_t psm_divergence_jsd(
    const psm_real_t* p,
    const psm_real_t* q,
    psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined
);

// sqrt of the above, in [0, sqrt(ln 2)]
PSM_EXPORT psm_error_t psm_divergence_sqrt_jsd(
    const psm_real_t* p,
    const psm_real_t* q,
    psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined
);

#ifdef __cplusplus
}
#endif
