// =============================================================================
// FILE: psm/binding/c_api/divergence.cpp
// BRIEF: C API implementation for distribution divergences
// =============================================================================

#include "psm/binding/c_api/divergence.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/kernel/divergence.hpp"
#include "psm/core/type.hpp"
#include "psm/core/error.hpp"

#include <limits>
#include <optional>

using namespace psm;
using namespace psm::binding;

namespace {

void store(const std::optional<Real>& value, psm_real_t* out, psm_bool_t* defined) noexcept {
    *out = value ? static_cast<psm_real_t>(*value)
                 : std::numeric_limits<psm_real_t>::quiet_NaN();
    *defined = value ? PSM_TRUE : PSM_FALSE;
}

} // anonymous namespace

extern "C" {

PSM_EXPORT psm_error_t psm_divergence_jsd(
    const psm_real_t* p,
    const psm_real_t* q,
    const psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined) {

    PSM_C_API_CHECK_NULL(p, "Distribution p is null");
    PSM_C_API_CHECK_NULL(q, "Distribution q is null");
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined pointer is null");

    PSM_C_API_TRY
        store(kernel::divergence::jsd(
                  Array<const Real>(reinterpret_cast<const Real*>(p), n),
                  Array<const Real>(reinterpret_cast<const Real*>(q), n)),
              out, defined);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_divergence_sqrt_jsd(
    const psm_real_t* p,
    const psm_real_t* q,
    const psm_size_t n,
    psm_real_t* out,
    psm_bool_t* defined) {

    PSM_C_API_CHECK_NULL(p, "Distribution p is null");
    PSM_C_API_CHECK_NULL(q, "Distribution q is null");
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined pointer is null");

    PSM_C_API_TRY
        store(kernel::divergence::sqrt_jsd(
                  Array<const Real>(reinterpret_cast<const Real*>(p), n),
                  Array<const Real>(reinterpret_cast<const Real*>(q), n)),
              out, defined);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

} // extern "C"
