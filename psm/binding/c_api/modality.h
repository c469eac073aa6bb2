#pragma once

// =============================================================================
// FILE: psm/binding/c_api/modality.h
// BRIEF: C API for modality estimation (single-pass, bootstrap, counts, cache)
// =============================================================================
//
// An estimator handle holds the bin thresholds (0, excluded_max,
// included_min, 1) and a content-keyed cache used by
// psm_modality_fit_transform. Estimators are immutable and may be shared
// across threads.
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Modality Codes (table order, also the tie-break order)
// =============================================================================

#define PSM_MODALITY_UNDEFINED (-1)
#define PSM_MODALITY_EXCLUDED 0
#define PSM_MODALITY_MIDDLE 1
#define PSM_MODALITY_INCLUDED 2
#define PSM_MODALITY_BIMODAL 3
#define PSM_MODALITY_UNIFORM 4
#define PSM_MODALITY_UNASSIGNED 5

#define PSM_N_MODALITIES 5              // reference table rows
#define PSM_N_MODALITY_CODES 6          // including unassigned
#define PSM_N_BINS 3

typedef struct psm_bootstrap_config {
    int64_t n_iter;                   // >= 1
    psm_real_t thresh;                // (0, 1]
    int64_t min_samples;              // >= 1
    uint64_t seed;
} psm_bootstrap_config_t;

// =============================================================================
// Estimator Lifecycle
// =============================================================================

// Requires 0 <= excluded_max < included_min <= 1 (defaults 0.2, 0.8)
PSM_EXPORT psm_error_t psm_estimator_create(
    psm_estimator_t* out,
    psm_real_t excluded_max,
    psm_real_t included_min
);

// Sets *estimator to NULL, safe to call with NULL
PSM_EXPORT psm_error_t psm_estimator_destroy(psm_estimator_t* estimator);

PSM_EXPORT psm_error_t psm_estimator_edges(
    psm_estimator_t estimator,
    psm_real_t* edges                 // Output [4]
);

// =============================================================================
// Reference Data
// =============================================================================

// Static lowercase name ("excluded", ..., "unassigned")
PSM_EXPORT psm_error_t psm_modality_name(int32_t code, const char** out);

PSM_EXPORT psm_error_t psm_modality_reference(
    psm_real_t* table                 // Output [5 * 3], row-major, row == code
);

// =============================================================================
// Single-Pass Estimation
// =============================================================================

PSM_EXPORT psm_error_t psm_modality_binify(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_real_t* fractions,            // Output [3 * n_events], row-major
    uint8_t* defined,                 // Output [n_events]
    psm_size_t n_events
);

// sqrt-JSD to each reference row, NaN for undefined events
PSM_EXPORT psm_error_t psm_modality_divergences(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_real_t* divergences,          // Output [5 * n_events], row-major
    psm_size_t n_events
);

PSM_EXPORT psm_error_t psm_modality_estimate(
    psm_estimator_t estimator,
    psm_dense_t psi,
    int8_t* codes,                    // Output [n_events], PSM_MODALITY_UNDEFINED if none
    psm_size_t n_events
);

// Code of the smallest entry of one divergence column. NaN entries are
// skipped, the first code wins ties, PSM_MODALITY_UNDEFINED if all are NaN.
PSM_EXPORT psm_error_t psm_modality_closest(
    const psm_real_t* divergences,    // [5], indexed by code
    int8_t* code
);

// =============================================================================
// Bootstrapped Estimation
// =============================================================================

// n_iter = 100, thresh = 0.6, min_samples = 10, seed = 0
PSM_EXPORT psm_error_t psm_bootstrap_config_default(psm_bootstrap_config_t* out);

PSM_EXPORT psm_error_t psm_modality_estimate_bootstrap(
    psm_estimator_t estimator,
    psm_dense_t psi,
    const psm_bootstrap_config_t* config,   // NULL = defaults
    int8_t* codes,                    // Output [n_events], never undefined
    psm_real_t* vote_fractions,       // Optional output [5 * n_events], may be NULL
    psm_index_t* valid_trials,        // Optional output [n_events], may be NULL
    psm_size_t n_events
);

// Code with the largest vote fraction >= thresh, first code on ties,
// PSM_MODALITY_UNASSIGNED if none qualifies. thresh in (0, 1].
PSM_EXPORT psm_error_t psm_bootstrap_select(
    const psm_real_t* fractions,      // [5], indexed by code
    psm_real_t thresh,
    int8_t* code
);

// Resampled row indices of one trial. The first ceil(n/2) are drawn with
// replacement from the first ceil(n/2) entries of a seeded permutation of
// the rows, the rest from its remaining entries.
PSM_EXPORT psm_error_t psm_bootstrap_trial_indices(
    uint64_t seed,
    psm_index_t trial,                // >= 0
    psm_index_t* indices,             // Output [n_samples]
    psm_index_t* permutation,         // Optional output [n_samples], may be NULL
    psm_size_t n_samples
);

// =============================================================================
// Counts
// =============================================================================

// Events per modality code. Single-pass skips undefined events.
PSM_EXPORT psm_error_t psm_modality_counts(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_bool_t bootstrapped,
    const psm_bootstrap_config_t* config,   // NULL = defaults, ignored if !bootstrapped
    psm_index_t* counts               // Output [6]
);

// =============================================================================
// Cached Estimation
// =============================================================================

// Same codes as psm_modality_estimate / _bootstrap, served from the
// estimator's cache when the PSI contents and settings are unchanged
PSM_EXPORT psm_error_t psm_modality_fit_transform(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_bool_t bootstrapped,
    const psm_bootstrap_config_t* config,   // NULL = defaults
    int8_t* codes,                    // Output [n_events]
    psm_size_t n_events
);

PSM_EXPORT psm_error_t psm_modality_cache_clear(psm_estimator_t estimator);

PSM_EXPORT psm_error_t psm_modality_cache_stats(
    psm_estimator_t estimator,
    psm_size_t* size,
    uint64_t* hits,
    uint64_t* misses
);

// capacity >= 1, oldest entries are evicted first
PSM_EXPORT psm_error_t psm_modality_cache_set_capacity(
    psm_estimator_t estimator,
    psm_size_t capacity
);

#ifdef __cplusplus
}
#endif
