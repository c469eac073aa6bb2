#pragma once

#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/log.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/memory.hpp"
#include "psm/core/random.hpp"
#include "psm/kernel/binning.hpp"
#include "psm/kernel/modality.hpp"
#include "psm/threading/parallel_for.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <numeric>
#include <optional>
#include <vector>

// =============================================================================
// FILE: psm/kernel/bootstrap.hpp
// BRIEF: Bootstrapped modality estimation and per-modality counts
// =============================================================================
//
// Each trial shuffles the samples, splits them into a train half
// (ceil(n/2)) and a test half, resamples each half with replacement from
// within itself and concatenates them. Every trial votes through the
// single-pass estimator, the final label is the modality whose vote
// fraction reaches the threshold (largest fraction, table order on ties).
// =============================================================================

namespace psm::kernel::bootstrap {

using modality::Modality;
using modality::ModalityCounts;
using modality::ModalityEstimator;

namespace config {
    constexpr Index DEFAULT_N_ITER = 100;
    constexpr Real DEFAULT_THRESH = Real(0.6);
    constexpr Index DEFAULT_MIN_SAMPLES = 10;
    constexpr std::uint64_t DEFAULT_SEED = 0;

    constexpr std::int8_t NO_VOTE = -1;
}

// =============================================================================
// Configuration
// =============================================================================

struct BootstrapConfig {
    Index n_iter = config::DEFAULT_N_ITER;
    Real thresh = config::DEFAULT_THRESH;
    Index min_samples = config::DEFAULT_MIN_SAMPLES;
    std::uint64_t seed = config::DEFAULT_SEED;

    void validate() const {
        PSM_CHECK_ARG(n_iter >= 1, "Bootstrap: n_iter must be >= 1");
        PSM_CHECK_ARG(thresh > Real(0) && thresh <= Real(1),
                      "Bootstrap: thresh must be in (0, 1]");
        PSM_CHECK_ARG(min_samples >= 1, "Bootstrap: min_samples must be >= 1");
    }
};

/// @brief Bootstrap output, all tables indexed by event.
///
/// vote_fractions is row-major (5 x n_events), row == Modality code.
struct BootstrapResult {
    Index n_events = 0;
    std::vector<Modality> assignments;
    std::vector<Real> vote_fractions;
    std::vector<Index> valid_trials;
};

// =============================================================================
// Trial Generation
// =============================================================================

/// @brief Row indices of one resampled trial, out.len == n_samples.
///
/// out[0, ceil(n/2)) is drawn from permutation[0, ceil(n/2)) and the rest
/// from the remaining rows. The shuffled permutation is copied to
/// permutation when it is non-null (n_samples entries).
inline void make_trial_indices(std::uint64_t seed, Index trial, Array<Index> out,
                               Index* permutation = nullptr) {
    const Size n = out.len;
    if (n == 0) {
        return;
    }

    random::FastRNG rng(random::hash_combine(seed, static_cast<std::uint64_t>(trial)));

    auto perm = memory::aligned_alloc<Index>(n);
    std::iota(perm.get(), perm.get() + n, Index(0));
    random::shuffle(perm.get(), n, rng);
    if (permutation != nullptr) {
        std::copy(perm.get(), perm.get() + n, permutation);
    }

    const Size n_train = (n + 1) / 2;
    const Size n_test = n - n_train;

    for (Size i = 0; i < n_train; ++i) {
        out.ptr[i] = perm[rng.next_index(n_train)];
    }
    for (Size i = 0; i < n_test; ++i) {
        out.ptr[n_train + i] = perm[n_train + rng.next_index(n_test)];
    }
}

namespace detail {

// Copies the selected rows of psi into a contiguous (n x events) buffer
inline void gather_rows(
    const DenseArray<const Real>& psi,
    Array<const Index> rows,
    const DenseArray<Real>& out
) {
    const Size row_bytes = static_cast<Size>(psi.cols) * sizeof(Real);
    for (Size i = 0; i < rows.len; ++i) {
        auto src = psi.row(rows.ptr[i]);
        auto dst = out.row(static_cast<Index>(i));
        std::memcpy(dst.ptr, src.ptr, row_bytes);
    }
}

// One trial's votes, NO_VOTE for dropped or undefined events
inline void run_trial(
    const ModalityEstimator& estimator,
    const DenseArray<const Real>& psi,
    const BootstrapConfig& cfg,
    Index trial,
    std::int8_t* votes
) {
    const Index n_samples = psi.rows;
    const Index n_events = psi.cols;

    auto rows = memory::aligned_alloc<Index>(static_cast<Size>(n_samples));
    make_trial_indices(cfg.seed, trial, Array<Index>(rows.get(), static_cast<Size>(n_samples)));

    auto values = memory::aligned_alloc<Real>(static_cast<Size>(n_samples) *
                                              static_cast<Size>(n_events));
    DenseArray<Real> trial_psi(values.get(), n_samples, n_events);
    gather_rows(psi, Array<const Index>(rows.get(), static_cast<Size>(n_samples)), trial_psi);

    auto present = memory::aligned_alloc<Index>(static_cast<Size>(n_events));
    binning::count_present(trial_psi, Array<Index>(present.get(), static_cast<Size>(n_events)));

    auto labels = estimator.estimate(trial_psi);

    for (Index e = 0; e < n_events; ++e) {
        const auto& label = labels[static_cast<Size>(e)];
        if (present[e] < cfg.min_samples || !label) {
            votes[e] = config::NO_VOTE;
        } else {
            votes[e] = static_cast<std::int8_t>(*label);
        }
    }
}

} // namespace detail

// =============================================================================
// Vote Selection
// =============================================================================

// Modality with the largest vote fraction among those >= thresh. The first
// in table order wins ties, Unassigned when none qualifies.
[[nodiscard]] inline auto select_by_votes(
    const std::array<Real, modality::N_MODALITIES>& fractions,
    Real thresh
) noexcept -> Modality {
    Modality best = Modality::Unassigned;
    Real best_fraction = Real(-1);
    for (Size m = 0; m < modality::N_MODALITIES; ++m) {
        const Real f = fractions[m];
        if (f >= thresh && f > best_fraction) {
            best = static_cast<Modality>(m);
            best_fraction = f;
        }
    }
    return best;
}

// =============================================================================
// Bootstrapped Estimation
// =============================================================================

inline auto estimate_bootstrap(
    const ModalityEstimator& estimator,
    const DenseArray<const Real>& psi,
    const BootstrapConfig& cfg = {}
) -> BootstrapResult {
    cfg.validate();

    const Index n_events = psi.cols;
    const Size n_ev = static_cast<Size>(n_events);
    const Size n_trials = static_cast<Size>(cfg.n_iter);

    log::logger().debug("bootstrap: {} trials over {} samples x {} events "
                        "(thresh={}, min_samples={}, seed={})",
                        cfg.n_iter, psi.rows, n_events, cfg.thresh, cfg.min_samples, cfg.seed);

    BootstrapResult result;
    result.n_events = n_events;
    result.assignments.assign(n_ev, Modality::Unassigned);
    result.vote_fractions.assign(modality::N_MODALITIES * n_ev, Real(0));
    result.valid_trials.assign(n_ev, Index(0));

    if (n_events == 0) {
        return result;
    }

    // trial x events, written independently by each trial
    auto votes = memory::aligned_alloc<std::int8_t>(n_trials * n_ev);
    std::memset(votes.get(), config::NO_VOTE, n_trials * n_ev);

    if (psi.rows > 0) {
        threading::parallel_for(0, n_trials, [&](size_t t) {
            detail::run_trial(estimator, psi, cfg, static_cast<Index>(t), votes.get() + t * n_ev);
        });
    }

    // Serial reduce
    std::vector<std::array<Index, modality::N_MODALITIES>> tally(n_ev);
    for (auto& row : tally) {
        row.fill(0);
    }
    for (Size t = 0; t < n_trials; ++t) {
        const std::int8_t* trial_votes = votes.get() + t * n_ev;
        for (Size e = 0; e < n_ev; ++e) {
            if (trial_votes[e] != config::NO_VOTE) {
                ++tally[e][static_cast<Size>(trial_votes[e])];
                ++result.valid_trials[e];
            }
        }
    }

    Size n_silent = 0;
    for (Size e = 0; e < n_ev; ++e) {
        const Index valid = result.valid_trials[e];
        if (valid == 0) {
            ++n_silent;
            continue;
        }
        std::array<Real, modality::N_MODALITIES> fractions;
        for (Size m = 0; m < modality::N_MODALITIES; ++m) {
            fractions[m] = static_cast<Real>(tally[e][m]) / static_cast<Real>(valid);
            result.vote_fractions[m * n_ev + e] = fractions[m];
        }
        result.assignments[e] = select_by_votes(fractions, cfg.thresh);
    }

    if (n_silent > 0) {
        log::logger().debug("bootstrap: {} of {} events had no voting trial", n_silent, n_ev);
    }
    return result;
}

// =============================================================================
// Counts
// =============================================================================

/// @brief Number of events per modality.
///
/// Single-pass counts leave Unassigned at 0 and skip undefined events,
/// bootstrapped counts include Unassigned.
inline auto counts(
    const ModalityEstimator& estimator,
    const DenseArray<const Real>& psi,
    bool bootstrapped,
    const BootstrapConfig& cfg = {}
) -> ModalityCounts {
    if (bootstrapped) {
        return modality::count_assignments(estimate_bootstrap(estimator, psi, cfg).assignments);
    }
    return modality::count_assignments(estimator.estimate(psi));
}

} // namespace psm::kernel::bootstrap
