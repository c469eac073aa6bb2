#pragma once

// =============================================================================
// FILE: psm/binding/c_api/threading.h
// BRIEF: C API for worker-thread control
// =============================================================================

#include "psm/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// n = 0 selects the hardware concurrency. Ignored by the serial backend.
PSM_EXPORT psm_error_t psm_threading_set_num_threads(psm_size_t n);

// Always >= 1
PSM_EXPORT psm_error_t psm_threading_get_num_threads(psm_size_t* out);

#ifdef __cplusplus
}
#endif
