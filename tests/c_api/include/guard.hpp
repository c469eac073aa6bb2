#pragma once

// =============================================================================
// PSM - RAII Guards for C API Handles
// =============================================================================
//
//   Estimator est;
//   psm_estimator_create(est.ptr(), 0.2, 0.8);   // destroyed with est
//
// =============================================================================

#include "psm/binding/c_api/core/core.h"
#include "psm/binding/c_api/core/dense.h"
#include "psm/binding/c_api/modality.h"

#include <stdexcept>
#include <utility>

namespace psm::test {

// Owns a handle released by Destroy(&handle)
template <typename Handle, psm_error_t (*Destroy)(Handle*)>
class HandleGuard {
public:
    HandleGuard() = default;
    explicit HandleGuard(Handle h) : handle_(h) {}

    HandleGuard(HandleGuard&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)) {}

    HandleGuard& operator=(HandleGuard&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    HandleGuard(const HandleGuard&) = delete;
    HandleGuard& operator=(const HandleGuard&) = delete;

    ~HandleGuard() { reset(); }

    // Out parameter for psm_*_create
    [[nodiscard]] Handle* ptr() noexcept { return &handle_; }
    [[nodiscard]] Handle get() const noexcept { return handle_; }

    void reset() {
        if (handle_ != nullptr) {
            // Destroy fails only on a null handle
            (void)Destroy(&handle_);
            handle_ = nullptr;
        }
    }

    operator Handle() const noexcept { return handle_; }
    explicit operator bool() const noexcept { return handle_ != nullptr; }

private:
    Handle handle_ = nullptr;
};

// Borrows caller memory, which must outlive the guard
using Dense = HandleGuard<psm_dense_t, psm_dense_destroy>;

using Estimator = HandleGuard<psm_estimator_t, psm_estimator_destroy>;

// Default edges, throws on failure so a broken create fails the case
inline Estimator make_estimator(psm_real_t excluded_max = 0.2, psm_real_t included_min = 0.8) {
    Estimator est;
    if (psm_estimator_create(est.ptr(), excluded_max, included_min) != PSM_OK) {
        throw std::runtime_error(psm_get_last_error());
    }
    return est;
}

} // namespace psm::test
