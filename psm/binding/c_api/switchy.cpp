// =============================================================================
// FILE: psm/binding/c_api/switchy.cpp
// BRIEF: C API implementation for switchy scores
// =============================================================================

#include "psm/binding/c_api/switchy.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/kernel/switchy.hpp"
#include "psm/core/type.hpp"
#include "psm/core/error.hpp"

#include <limits>

using namespace psm;
using namespace psm::binding;

extern "C" {

PSM_EXPORT psm_error_t psm_switchy_score(
    const psm_real_t* values,
    const psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined) {

    PSM_C_API_CHECK_NULL(values, "Values array is null");
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined pointer is null");

    PSM_C_API_TRY
        auto score = kernel::switchy::switchy_score(
            Array<const Real>(reinterpret_cast<const Real*>(values), n));
        *out = score ? static_cast<psm_real_t>(*score)
                     : std::numeric_limits<psm_real_t>::quiet_NaN();
        *defined = score ? PSM_TRUE : PSM_FALSE;
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_switchy_scores(
    psm_dense_t psi,
    psm_real_t* scores,
    uint8_t* defined,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(scores, "Output scores array is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        kernel::switchy::switchy_scores(
            psi->view,
            Array<Real>(reinterpret_cast<Real*>(scores), n_events),
            Array<Byte>(defined, n_events));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_switchy_order(
    psm_dense_t psi,
    psm_index_t* order,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(order, "Output order array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        kernel::switchy::switchy_order(
            psi->view, Array<Index>(reinterpret_cast<Index*>(order), n_events));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

} // extern "C"
