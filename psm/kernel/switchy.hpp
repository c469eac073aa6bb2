#pragma once

#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/memory.hpp"
#include "psm/core/vectorize.hpp"
#include "psm/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <optional>

// =============================================================================
// FILE: psm/kernel/switchy.hpp
// BRIEF: Switchy score, a scalar summary of how an event sits along [0, 1]
// =============================================================================
//
// score = (1 - std(sin(pi v))) * (-mean(cos(pi v)))
//
// std is the population standard deviation, missing values are ignored.
// Events concentrated near 0 score about -1, near 1 about +1.
// =============================================================================

namespace psm::kernel::switchy {

namespace config {
    constexpr Size PARALLEL_THRESHOLD = 64;   // events
}

namespace detail {

// Score over n non-missing values already packed into x. sin_buf/cos_buf
// have room for n values.
inline Real score_packed(Array<const Real> x, Array<Real> sin_buf, Array<Real> cos_buf) {
    vectorize::sincos_pi(x, sin_buf, cos_buf);

    const Real inv_n = Real(1) / static_cast<Real>(x.len);
    const Real mean_sin = vectorize::sum(Array<const Real>(sin_buf)) * inv_n;
    const Real mean_cos = vectorize::sum(Array<const Real>(cos_buf)) * inv_n;
    const Real var_sin = vectorize::sum_squared_deviation(Array<const Real>(sin_buf), mean_sin) * inv_n;
    const Real std_sin = std::sqrt(std::max(var_sin, Real(0)));

    return (Real(1) - std_sin) * (-mean_cos);
}

} // namespace detail

// =============================================================================
// Single Event
// =============================================================================

inline std::optional<Real> switchy_score(Array<const Real> values) {
    auto packed = memory::aligned_alloc<Real>(values.len);
    Size n = 0;
    for (Size i = 0; i < values.len; ++i) {
        if (is_present(values.ptr[i])) {
            packed[n++] = values.ptr[i];
        }
    }
    if (n == 0) {
        return std::nullopt;
    }

    auto sin_buf = memory::aligned_alloc<Real>(n);
    auto cos_buf = memory::aligned_alloc<Real>(n);
    return detail::score_packed(Array<const Real>(packed.get(), n),
                                Array<Real>(sin_buf.get(), n),
                                Array<Real>(cos_buf.get(), n));
}

// =============================================================================
// Matrix
// =============================================================================

/// @brief Score per event (column). Events with no data get NaN, defined = 0.
inline void switchy_scores(
    const DenseArray<const Real>& psi,
    Array<Real> scores,
    Array<Byte> defined
) {
    const Index n_events = psi.cols;
    PSM_CHECK_DIM(scores.len == static_cast<Size>(n_events),
                  "Switchy: scores must have one entry per event");
    PSM_CHECK_DIM(defined.len == static_cast<Size>(n_events),
                  "Switchy: defined mask must have one entry per event");

    const Size n_rows = static_cast<Size>(psi.rows);

    auto score_event = [&](size_t e_idx) {
        const auto e = static_cast<Index>(e_idx);
        auto packed = memory::aligned_alloc<Real>(n_rows);
        Size n = 0;
        for (Index r = 0; r < psi.rows; ++r) {
            const Real v = psi(r, e);
            if (is_present(v)) {
                packed[n++] = v;
            }
        }
        if (n == 0) {
            scores[e] = MISSING;
            defined[e] = 0;
            return;
        }
        auto sin_buf = memory::aligned_alloc<Real>(n);
        auto cos_buf = memory::aligned_alloc<Real>(n);
        scores[e] = detail::score_packed(Array<const Real>(packed.get(), n),
                                         Array<Real>(sin_buf.get(), n),
                                         Array<Real>(cos_buf.get(), n));
        defined[e] = 1;
    };

    if (static_cast<Size>(n_events) >= config::PARALLEL_THRESHOLD) {
        threading::parallel_for(0, static_cast<size_t>(n_events), score_event);
    } else {
        for (Index e = 0; e < n_events; ++e) {
            score_event(static_cast<size_t>(e));
        }
    }
}

/// @brief Event indices sorted ascending by score, stable, undefined last.
inline void switchy_order(const DenseArray<const Real>& psi, Array<Index> order) {
    const Size n_events = static_cast<Size>(psi.cols);
    PSM_CHECK_DIM(order.len == n_events, "Switchy: order must have one entry per event");

    auto scores = memory::aligned_alloc<Real>(n_events);
    auto defined = memory::aligned_alloc<Byte>(n_events);
    switchy_scores(psi, Array<Real>(scores.get(), n_events), Array<Byte>(defined.get(), n_events));

    std::iota(order.begin(), order.end(), Index(0));
    std::stable_sort(order.begin(), order.end(), [&](Index a, Index b) {
        const bool da = defined[static_cast<Size>(a)] != 0;
        const bool db = defined[static_cast<Size>(b)] != 0;
        if (da != db) {
            return da;
        }
        return da && scores[static_cast<Size>(a)] < scores[static_cast<Size>(b)];
    });
}

} // namespace psm::kernel::switchy
