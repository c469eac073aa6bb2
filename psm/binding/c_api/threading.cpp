// =============================================================================
// FILE: psm/binding/c_api/threading.cpp
// BRIEF: C API implementation for worker-thread control
// =============================================================================

#include "psm/binding/c_api/threading.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/threading/scheduler.hpp"

using psm::threading::Scheduler;

extern "C" {

PSM_EXPORT psm_error_t psm_threading_set_num_threads(const psm_size_t n) {
    PSM_C_API_TRY
        Scheduler::set_num_threads(static_cast<size_t>(n));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_threading_get_num_threads(psm_size_t* out) {
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<psm_size_t>(Scheduler::get_num_threads());
    PSM_C_API_RETURN_OK;
}

} // extern "C"
