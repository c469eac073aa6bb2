#pragma once

#include "psm/core/type.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/error.hpp"
#include "psm/core/simd.hpp"

#include <cmath>
#include <numbers>

// =============================================================================
// FILE: psm/core/vectorize.hpp
// BRIEF: Vector loops over the present PSI values of one event
// =============================================================================
//
// Inputs are packed buffers with missing values already removed, so no
// lane needs a NaN mask. Each loop runs full vectors first and finishes the
// tail in scalar code.
// =============================================================================

namespace psm::vectorize {

template <typename T>
PSM_FORCE_INLINE T sum(Array<const T> x) {
    namespace hn = psm::simd;
    const hn::Tag<T> d;
    const Size lanes = hn::Lanes(d);
    const Size n = x.size();

    // Two chains hide the add latency
    auto lo = hn::Zero(d);
    auto hi = hn::Zero(d);
    Size i = 0;
    while (i + 2 * lanes <= n) {
        lo = hn::Add(lo, hn::LoadU(d, x.data() + i));
        hi = hn::Add(hi, hn::LoadU(d, x.data() + i + lanes));
        i += 2 * lanes;
    }
    if (i + lanes <= n) {
        lo = hn::Add(lo, hn::LoadU(d, x.data() + i));
        i += lanes;
    }

    T total = hn::ReduceSum(d, hn::Add(lo, hi));
    for (; i < n; ++i) {
        total += x.data()[i];
    }
    return total;
}

// n * population variance of x around center
template <typename T>
PSM_FORCE_INLINE T sum_squared_deviation(Array<const T> x, T center) {
    namespace hn = psm::simd;
    const hn::Tag<T> d;
    const Size lanes = hn::Lanes(d);
    const Size n = x.size();
    const auto c = hn::Set(d, center);

    auto acc = hn::Zero(d);
    Size i = 0;
    for (; i + lanes <= n; i += lanes) {
        const auto dev = hn::Sub(hn::LoadU(d, x.data() + i), c);
        acc = hn::MulAdd(dev, dev, acc);
    }

    T total = hn::ReduceSum(d, acc);
    for (; i < n; ++i) {
        const T dev = x.data()[i] - center;
        total += dev * dev;
    }
    return total;
}

// s[i] = sin(pi x[i]), c[i] = cos(pi x[i])
template <typename T>
PSM_FORCE_INLINE void sincos_pi(Array<const T> x, Array<T> s, Array<T> c) {
    PSM_CHECK_DIM(s.size() == x.size() && c.size() == x.size(),
                  "sincos_pi: output length differs from input");

    namespace hn = psm::simd;
    const hn::Tag<T> d;
    const Size lanes = hn::Lanes(d);
    const Size n = x.size();
    constexpr T pi = std::numbers::pi_v<T>;
    const auto vpi = hn::Set(d, pi);

    Size i = 0;
    for (; i + lanes <= n; i += lanes) {
        const auto angle = hn::Mul(hn::LoadU(d, x.data() + i), vpi);
        hn::StoreU(hn::Sin(d, angle), d, s.data() + i);
        hn::StoreU(hn::Cos(d, angle), d, c.data() + i);
    }
    for (; i < n; ++i) {
        const T angle = x.data()[i] * pi;
        s.data()[i] = std::sin(angle);
        c.data()[i] = std::cos(angle);
    }
}

} // namespace psm::vectorize
