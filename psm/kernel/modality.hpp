#pragma once

#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/memory.hpp"
#include "psm/kernel/binning.hpp"
#include "psm/kernel/divergence.hpp"
#include "psm/threading/parallel_for.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: psm/kernel/modality.hpp
// BRIEF: Modality reference table and single-pass estimator
// =============================================================================
//
// Each event's PSI values are binned into [0, a], (a, b), [b, 1] and the
// binned distribution is compared to five idealized shapes. The closest
// shape (smallest sqrt-JSD) is the event's modality.
// =============================================================================

namespace psm::kernel::modality {

namespace config {
    constexpr Real DEFAULT_EXCLUDED_MAX = Real(0.2);
    constexpr Real DEFAULT_INCLUDED_MIN = Real(0.8);
    constexpr Size PARALLEL_THRESHOLD = 64;   // events
}

// =============================================================================
// Modality Codes
// =============================================================================

enum class Modality : std::int8_t {
    Excluded = 0,
    Middle = 1,
    Included = 2,
    Bimodal = 3,
    Uniform = 4,
    Unassigned = 5
};

constexpr Size N_BINS = 3;
constexpr Size N_EDGES = N_BINS + 1;
constexpr Size N_MODALITIES = 5;    // rows of the reference table
constexpr Size N_CODES = 6;         // including Unassigned

using Edges = std::array<Real, N_EDGES>;
using ModalityCounts = std::array<Index, N_CODES>;

// Ordered, row index == Modality code. Order is the tie-break order.
inline constexpr std::array<std::array<Real, N_BINS>, N_MODALITIES> REFERENCE_TABLE = {{
    {Real(1), Real(0), Real(0)},    // excluded
    {Real(0), Real(1), Real(0)},    // middle
    {Real(0), Real(0), Real(1)},    // included
    {Real(1), Real(0), Real(1)},    // bimodal
    {Real(1), Real(1), Real(1)},    // uniform
}};

inline constexpr std::array<std::string_view, N_CODES> MODALITY_NAMES = {
    "excluded", "middle", "included", "bimodal", "uniform", "unassigned"
};

[[nodiscard]] constexpr auto modality_name(Modality m) noexcept -> std::string_view {
    const auto idx = static_cast<Size>(m);
    return idx < N_CODES ? MODALITY_NAMES[idx] : std::string_view{};
}

// Strict argmin over one event's divergence column. The first row in table
// order wins ties, NaN entries are skipped, nullopt when every entry is NaN.
[[nodiscard]] inline auto closest(const std::array<Real, N_MODALITIES>& scores) noexcept
    -> std::optional<Modality> {
    std::optional<Modality> best;
    Real best_score = std::numeric_limits<Real>::infinity();
    for (Size m = 0; m < N_MODALITIES; ++m) {
        const Real s = scores[m];
        if (is_missing(s)) {
            continue;
        }
        if (!best || s < best_score) {
            best = static_cast<Modality>(m);
            best_score = s;
        }
    }
    return best;
}

namespace detail {

// sqrt-JSD of one binned column against every reference row
PSM_FORCE_INLINE void score_column(
    const std::array<Real, N_BINS>& binned,
    std::array<Real, N_MODALITIES>& scores
) {
    const Array<const Real> p(binned.data(), N_BINS);
    for (Size m = 0; m < N_MODALITIES; ++m) {
        auto d = divergence::sqrt_jsd(p, Array<const Real>(REFERENCE_TABLE[m].data(), N_BINS));
        scores[m] = d ? *d : MISSING;
    }
}

template <typename Func>
inline void for_each_event(Index n_events, Func&& func) {
    if (static_cast<Size>(n_events) >= config::PARALLEL_THRESHOLD) {
        threading::parallel_for(0, static_cast<size_t>(n_events), func);
    } else {
        for (Index e = 0; e < n_events; ++e) {
            func(static_cast<size_t>(e));
        }
    }
}

} // namespace detail

// =============================================================================
// Single-Pass Estimator
// =============================================================================

/// @brief Binned-divergence modality estimator.
///
/// Immutable after construction and safe to share across threads. Bin edges
/// are (0, excluded_max, included_min, 1) with
/// 0 <= excluded_max < included_min <= 1.
class ModalityEstimator {
public:
    explicit ModalityEstimator(
        Real excluded_max = config::DEFAULT_EXCLUDED_MAX,
        Real included_min = config::DEFAULT_INCLUDED_MIN
    ) : edges_{Real(0), excluded_max, included_min, Real(1)} {
        PSM_CHECK_ARG(std::isfinite(excluded_max) && std::isfinite(included_min),
                      "ModalityEstimator: bin thresholds must be finite");
        PSM_CHECK_ARG(excluded_max >= Real(0),
                      "ModalityEstimator: excluded_max must be >= 0");
        PSM_CHECK_ARG(excluded_max < included_min,
                      "ModalityEstimator: excluded_max must be < included_min");
        PSM_CHECK_ARG(included_min <= Real(1),
                      "ModalityEstimator: included_min must be <= 1");
    }

    [[nodiscard]] auto edges() const noexcept -> const Edges& { return edges_; }

    [[nodiscard]] auto edge_array() const noexcept -> Array<const Real> {
        return Array<const Real>(edges_.data(), N_EDGES);
    }

    /// @brief Bin fractions (3 x events) with a per-event defined flag.
    void binify(
        const DenseArray<const Real>& psi,
        const DenseArray<Real>& fractions,
        Array<Byte> defined
    ) const {
        binning::detail::binify_impl(psi, edge_array(), fractions, defined,
                                     binning::LastBin::Closed);
    }

    /// @brief sqrt-JSD of every event to every reference row (5 x events).
    ///
    /// Undefined events get a NaN column.
    void divergences(const DenseArray<const Real>& psi, const DenseArray<Real>& out) const {
        const Index n_events = psi.cols;
        PSM_CHECK_DIM(out.rows == static_cast<Index>(N_MODALITIES) && out.cols == n_events,
                      "ModalityEstimator: divergences must be (5 x n_events)");

        auto fractions = memory::aligned_alloc<Real>(N_BINS * static_cast<Size>(n_events));
        auto defined = memory::aligned_alloc<Byte>(static_cast<Size>(n_events));
        DenseArray<Real> frac_view(fractions.get(), static_cast<Index>(N_BINS), n_events);
        binify(psi, frac_view, Array<Byte>(defined.get(), static_cast<Size>(n_events)));

        detail::for_each_event(n_events, [&](size_t e_idx) {
            const auto e = static_cast<Index>(e_idx);
            std::array<Real, N_MODALITIES> scores;
            if (defined[e_idx] == 0) {
                scores.fill(MISSING);
            } else {
                std::array<Real, N_BINS> binned;
                for (Size b = 0; b < N_BINS; ++b) {
                    binned[b] = frac_view(static_cast<Index>(b), e);
                }
                detail::score_column(binned, scores);
            }
            for (Size m = 0; m < N_MODALITIES; ++m) {
                out(static_cast<Index>(m), e) = scores[m];
            }
        });
    }

    /// @brief Closest reference shape per event, nullopt when undefined.
    [[nodiscard]] auto estimate(const DenseArray<const Real>& psi) const
        -> std::vector<std::optional<Modality>> {
        const Index n_events = psi.cols;
        std::vector<std::optional<Modality>> result(static_cast<Size>(n_events));
        if (n_events == 0) {
            return result;
        }

        auto scores = memory::aligned_alloc<Real>(N_MODALITIES * static_cast<Size>(n_events));
        DenseArray<Real> score_view(scores.get(), static_cast<Index>(N_MODALITIES), n_events);
        divergences(psi, score_view);

        for (Index e = 0; e < n_events; ++e) {
            std::array<Real, N_MODALITIES> column;
            for (Size m = 0; m < N_MODALITIES; ++m) {
                column[m] = score_view(static_cast<Index>(m), e);
            }
            result[static_cast<Size>(e)] = closest(column);
        }
        return result;
    }

private:
    Edges edges_;
};

// =============================================================================
// Counts
// =============================================================================

// Undefined events are not counted
[[nodiscard]] inline auto count_assignments(const std::vector<std::optional<Modality>>& assignments)
    -> ModalityCounts {
    ModalityCounts counts{};
    for (const auto& a : assignments) {
        if (a) {
            ++counts[static_cast<Size>(*a)];
        }
    }
    return counts;
}

[[nodiscard]] inline auto count_assignments(const std::vector<Modality>& assignments)
    -> ModalityCounts {
    ModalityCounts counts{};
    for (Modality a : assignments) {
        ++counts[static_cast<Size>(a)];
    }
    return counts;
}

} // namespace psm::kernel::modality
