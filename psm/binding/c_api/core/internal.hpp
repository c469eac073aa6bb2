#pragma once

// =============================================================================
// FILE: psm/binding/c_api/core/internal.hpp
// BRIEF: Handle layouts and error plumbing shared by the C entry points
// =============================================================================
//
// Only the binding .cpp files include this. Each entry point validates its
// pointers with PSM_C_API_CHECK_NULL, runs its body between PSM_C_API_TRY
// and PSM_C_API_CATCH, and ends with PSM_C_API_RETURN_OK.
// =============================================================================

#include "psm/binding/c_api/core/core.h"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/type.hpp"
#include "psm/kernel/cache.hpp"
#include "psm/kernel/modality.hpp"

#include <string_view>

namespace psm::binding {

// Edges are fixed at creation, the cache fills as estimates run
struct EstimatorState {
    kernel::modality::ModalityEstimator estimator;
    kernel::cache::ModalityCache cache;

    EstimatorState(Real excluded_max, Real included_min)
        : estimator(excluded_max, included_min) {}
};

// Per-thread record behind psm_get_last_error, truncated to 511 chars
void set_last_error(psm_error_t code, std::string_view message) noexcept;
void clear_last_error() noexcept;
[[nodiscard]] auto get_last_error_message() noexcept -> const char*;
[[nodiscard]] auto get_last_error_code() noexcept -> psm_error_t;

// Maps the in-flight exception to a C code and records its message.
// Call only inside a catch handler.
[[nodiscard]] auto handle_exception() noexcept -> psm_error_t;

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define PSM_C_API_CHECK(cond, code, msg) \
    do { \
        if (PSM_UNLIKELY(!(cond))) { \
            psm::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while (0)

#define PSM_C_API_CHECK_NULL(ptr, msg) \
    PSM_C_API_CHECK((ptr) != nullptr, PSM_ERROR_NULL_POINTER, msg)

#define PSM_C_API_TRY try {

// No exception may cross the C boundary
#define PSM_C_API_CATCH \
    } catch (...) { \
        return psm::binding::handle_exception(); \
    }

#define PSM_C_API_RETURN_OK \
    do { \
        psm::binding::clear_last_error(); \
        return PSM_OK; \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace psm::binding

// Completes the opaque types declared in core.h

// Borrowed caller memory, never copied or freed
struct psm_dense_matrix {
    psm::DenseArray<const psm::Real> view;

    psm_dense_matrix(const psm::Real* data, psm::Index rows, psm::Index cols,
                     psm::Index stride) noexcept
        : view(data, rows, cols, stride) {}
};

struct psm_estimator : psm::binding::EstimatorState {
    using EstimatorState::EstimatorState;
};
