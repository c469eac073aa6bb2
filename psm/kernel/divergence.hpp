#pragma once

#include "psm/core/type.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>

// =============================================================================
// FILE: psm/kernel/divergence.hpp
// BRIEF: Jensen-Shannon divergence between binned distributions
// =============================================================================
//
// Natural log throughout, so jsd lies in [0, ln 2] and sqrt_jsd in
// [0, sqrt(ln 2)]. Both inputs are normalized to unit mass first.
// =============================================================================

namespace psm::kernel::divergence {

namespace config {
    constexpr Real LN_2 = std::numbers::ln2_v<Real>;
    constexpr Real SQRT_LN_2 = Real(0.83255461115769775635);
}

namespace detail {

// Total mass, nullopt when any entry is negative, non-finite, or the mass is 0
PSM_FORCE_INLINE std::optional<Real> mass(Array<const Real> p) noexcept {
    Real total = Real(0);
    for (Size i = 0; i < p.len; ++i) {
        const Real v = p.ptr[i];
        if (PSM_UNLIKELY(!std::isfinite(v) || v < Real(0))) {
            return std::nullopt;
        }
        total += v;
    }
    if (!(total > Real(0))) {
        return std::nullopt;
    }
    return total;
}

// p_i * log(p_i / m_i) with 0 log 0 := 0
PSM_FORCE_INLINE Real kl_term(Real p, Real m) noexcept {
    return (p > Real(0)) ? p * std::log(p / m) : Real(0);
}

} // namespace detail

// =============================================================================
// Jensen-Shannon
// =============================================================================

inline std::optional<Real> jsd(Array<const Real> p, Array<const Real> q) {
    PSM_CHECK_DIM(p.len == q.len, "Divergence: distribution length mismatch");

    auto p_mass = detail::mass(p);
    auto q_mass = detail::mass(q);
    if (!p_mass || !q_mass) {
        return std::nullopt;
    }

    const Real inv_p = Real(1) / *p_mass;
    const Real inv_q = Real(1) / *q_mass;

    Real js_p = Real(0);
    Real js_q = Real(0);
    for (Size i = 0; i < p.len; ++i) {
        const Real pi = p.ptr[i] * inv_p;
        const Real qi = q.ptr[i] * inv_q;
        const Real m = (pi + qi) * Real(0.5);
        js_p += detail::kl_term(pi, m);
        js_q += detail::kl_term(qi, m);
    }

    const Real js = (js_p + js_q) * Real(0.5);
    return std::clamp(js, Real(0), config::LN_2);
}

inline std::optional<Real> sqrt_jsd(Array<const Real> p, Array<const Real> q) {
    auto js = jsd(p, q);
    if (!js) {
        return std::nullopt;
    }
    return std::min(std::sqrt(*js), config::SQRT_LN_2);
}

} // namespace psm::kernel::divergence
