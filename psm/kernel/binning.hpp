#pragma once

#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"
#include "psm/threading/parallel_for.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>

// =============================================================================
// FILE: psm/kernel/binning.hpp
// BRIEF: Per-event discretization of PSI values into bin fractions
// =============================================================================
//
// Interval convention for edges e0 < e1 < ... < ek (k bins):
//   bin 0        [e0, e1]
//   bin i        (e_i, e_{i+1}]
//
// LastBin::Closed also gives the last bin its left edge, [e_{k-1}, e_k].
// The modality estimator bins that way so that (0, a, b, 1) yields
// [0, a], (a, b), [b, 1]. For k = 2 the shared edge stays in bin 0.
// NaN and values outside [e0, ek] fall in no bin.
// =============================================================================

namespace psm::kernel::binning {

namespace config {
    constexpr Size MIN_EDGES = 2;
    constexpr Size PARALLEL_THRESHOLD = 64;   // events
}

enum class LastBin {
    LeftOpen,   // (e_{k-1}, e_k]
    Closed      // [e_{k-1}, e_k]
};

// =============================================================================
// Edge Validation
// =============================================================================

inline void validate_edges(Array<const Real> edges) {
    PSM_CHECK_ARG(edges.len >= config::MIN_EDGES,
                  "Binning: at least 2 edges are required, got " + std::to_string(edges.len));
    for (Size i = 0; i < edges.len; ++i) {
        PSM_CHECK_ARG(std::isfinite(edges.ptr[i]), "Binning: edges must be finite");
        if (i > 0) {
            PSM_CHECK_ARG(edges.ptr[i - 1] < edges.ptr[i],
                          "Binning: edges must be strictly increasing (edge " +
                          std::to_string(i) + ")");
        }
    }
}

// =============================================================================
// Single Value
// =============================================================================

// Bin of v, nullopt for NaN or out-of-range. Edges are assumed validated.
PSM_FORCE_INLINE std::optional<Index> bin_index(
    Real v, Array<const Real> edges, LastBin last = LastBin::LeftOpen
) noexcept {
    const Size n_bins = edges.len - 1;
    const Real lo = edges.ptr[0];
    const Real hi = edges.ptr[n_bins];

    // NaN fails both comparisons
    if (!(v >= lo && v <= hi)) {
        return std::nullopt;
    }
    if (v <= edges.ptr[1]) {
        return Index(0);
    }
    if (last == LastBin::Closed && n_bins >= 2 && v >= edges.ptr[n_bins - 1]) {
        return static_cast<Index>(n_bins - 1);
    }

    // Interior: first i with v <= e_{i+1}
    Size left = 1;
    Size right = n_bins;
    while (left < right) {
        Size mid = left + (right - left) / 2;
        if (v <= edges.ptr[mid + 1]) {
            right = mid;
        } else {
            left = mid + 1;
        }
    }
    return static_cast<Index>(left);
}

// =============================================================================
// Matrix Binning
// =============================================================================

namespace detail {

// Edges already validated by the caller. The modality estimator enters here
// directly since its (0, a, b, 1) edges may touch at 0 or 1.
inline void binify_impl(
    const DenseArray<const Real>& psi,
    Array<const Real> edges,
    const DenseArray<Real>& fractions,
    Array<Byte> defined,
    LastBin last
) {
    const Index n_bins = static_cast<Index>(edges.len - 1);
    const Index n_events = psi.cols;

    PSM_CHECK_DIM(fractions.rows == n_bins && fractions.cols == n_events,
                  "Binning: fractions must be (n_bins x n_events)");
    PSM_CHECK_DIM(defined.len == static_cast<Size>(n_events),
                  "Binning: defined mask must have one entry per event");

    auto bin_event = [&](size_t e_idx) {
        const auto e = static_cast<Index>(e_idx);
        for (Index b = 0; b < n_bins; ++b) {
            fractions(b, e) = Real(0);
        }

        Index total = 0;
        for (Index r = 0; r < psi.rows; ++r) {
            auto bin = bin_index(psi(r, e), edges, last);
            if (bin) {
                fractions(*bin, e) += Real(1);
                ++total;
            }
        }

        if (PSM_UNLIKELY(total == 0)) {
            for (Index b = 0; b < n_bins; ++b) {
                fractions(b, e) = MISSING;
            }
            defined[e] = 0;
            return;
        }

        const Real inv_total = Real(1) / static_cast<Real>(total);
        for (Index b = 0; b < n_bins; ++b) {
            fractions(b, e) *= inv_total;
        }
        defined[e] = 1;
    };

    if (static_cast<Size>(n_events) >= config::PARALLEL_THRESHOLD) {
        threading::parallel_for(0, static_cast<size_t>(n_events), bin_event);
    } else {
        for (Index e = 0; e < n_events; ++e) {
            bin_event(static_cast<size_t>(e));
        }
    }
}

} // namespace detail

/// @brief Fraction of in-range values per bin, per event.
///
/// fractions is (n_bins x n_events). An event with no in-range value gets a
/// NaN column and defined[e] = 0, everything else defined[e] = 1.
inline void binify(
    const DenseArray<const Real>& psi,
    Array<const Real> edges,
    const DenseArray<Real>& fractions,
    Array<Byte> defined,
    LastBin last = LastBin::LeftOpen
) {
    validate_edges(edges);
    detail::binify_impl(psi, edges, fractions, defined, last);
}

/// @brief Number of non-missing (non-NaN) values per event.
inline void count_present(const DenseArray<const Real>& psi, Array<Index> counts) {
    PSM_CHECK_DIM(counts.len == static_cast<Size>(psi.cols),
                  "Binning: counts must have one entry per event");

    for (Index e = 0; e < psi.cols; ++e) {
        counts[e] = 0;
    }
    for (Index r = 0; r < psi.rows; ++r) {
        auto row = psi.row(r);
        for (Index e = 0; e < psi.cols; ++e) {
            if (is_present(row[e])) {
                ++counts[e];
            }
        }
    }
}

} // namespace psm::kernel::binning
