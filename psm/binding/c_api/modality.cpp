// =============================================================================
// FILE: psm/binding/c_api/modality.cpp
// BRIEF: C API implementation for modality estimation
// =============================================================================

#include "psm/binding/c_api/modality.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/kernel/bootstrap.hpp"
#include "psm/kernel/cache.hpp"
#include "psm/kernel/modality.hpp"
#include "psm/core/type.hpp"
#include "psm/core/error.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>

using namespace psm;
using namespace psm::binding;

namespace md = psm::kernel::modality;
namespace bs = psm::kernel::bootstrap;

static_assert(std::is_same_v<psm_index_t, Index>);
static_assert(PSM_N_MODALITIES == md::N_MODALITIES);
static_assert(PSM_N_MODALITY_CODES == md::N_CODES);
static_assert(PSM_N_BINS == md::N_BINS);
static_assert(PSM_MODALITY_UNASSIGNED == static_cast<int>(md::Modality::Unassigned));
static_assert(PSM_MODALITY_UNDEFINED == kernel::cache::UNDEFINED_CODE);

namespace {

// The C struct is int64 regardless of PSM_INDEX_PRECISION
auto to_index(int64_t value, const char* field) -> Index {
    PSM_CHECK_ARG(value >= static_cast<int64_t>(std::numeric_limits<Index>::min()) &&
                  value <= static_cast<int64_t>(std::numeric_limits<Index>::max()),
                  std::string("Bootstrap: ") + field + " = " + std::to_string(value) +
                  " does not fit psm_index_t (" PSM_INDEX_TYPE_NAME ")");
    return static_cast<Index>(value);
}

auto to_config(const psm_bootstrap_config_t* config) -> bs::BootstrapConfig {
    bs::BootstrapConfig cfg;
    if (config != nullptr) {
        cfg.n_iter = to_index(config->n_iter, "n_iter");
        cfg.thresh = static_cast<Real>(config->thresh);
        cfg.min_samples = to_index(config->min_samples, "min_samples");
        cfg.seed = config->seed;
    }
    return cfg;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Estimator Lifecycle
// =============================================================================

PSM_EXPORT psm_error_t psm_estimator_create(
    psm_estimator_t* out,
    const psm_real_t excluded_max,
    const psm_real_t included_min) {

    PSM_C_API_CHECK_NULL(out, "Output pointer is null");

    PSM_C_API_TRY
        *out = std::make_unique<psm_estimator>(
            static_cast<Real>(excluded_max), static_cast<Real>(included_min)
        ).release();
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_estimator_destroy(psm_estimator_t* estimator) {
    if (estimator == nullptr || *estimator == nullptr) {
        PSM_C_API_RETURN_OK;
    }

    delete *estimator;
    *estimator = nullptr;
    PSM_C_API_RETURN_OK;
}

PSM_EXPORT psm_error_t psm_estimator_edges(
    psm_estimator_t estimator,
    psm_real_t* edges) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(edges, "Output edges array is null");

    const auto& e = estimator->estimator.edges();
    std::copy(e.begin(), e.end(), edges);
    PSM_C_API_RETURN_OK;
}

// =============================================================================
// Reference Data
// =============================================================================

PSM_EXPORT psm_error_t psm_modality_name(const int32_t code, const char** out) {
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    PSM_C_API_CHECK(code >= 0 && code < PSM_N_MODALITY_CODES, PSM_ERROR_INVALID_ARGUMENT,
                   "Modality code must be in [0, 6)");

    // Names are string literals, so data() is NUL-terminated
    *out = md::modality_name(static_cast<md::Modality>(code)).data();
    PSM_C_API_RETURN_OK;
}

PSM_EXPORT psm_error_t psm_modality_reference(psm_real_t* table) {
    PSM_C_API_CHECK_NULL(table, "Output table is null");

    for (Size m = 0; m < md::N_MODALITIES; ++m) {
        for (Size b = 0; b < md::N_BINS; ++b) {
            table[m * md::N_BINS + b] = static_cast<psm_real_t>(md::REFERENCE_TABLE[m][b]);
        }
    }
    PSM_C_API_RETURN_OK;
}

// =============================================================================
// Single-Pass Estimation
// =============================================================================

PSM_EXPORT psm_error_t psm_modality_binify(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_real_t* fractions,
    uint8_t* defined,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(fractions, "Output fractions array is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        DenseArray<Real> frac(reinterpret_cast<Real*>(fractions),
                              static_cast<Index>(md::N_BINS), psi->view.cols);
        estimator->estimator.binify(psi->view, frac, Array<Byte>(defined, n_events));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_divergences(
    psm_estimator_t estimator,
    psm_dense_t psi,
    psm_real_t* divergences,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(divergences, "Output divergences array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        DenseArray<Real> out(reinterpret_cast<Real*>(divergences),
                             static_cast<Index>(md::N_MODALITIES), psi->view.cols);
        estimator->estimator.divergences(psi->view, out);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_estimate(
    psm_estimator_t estimator,
    psm_dense_t psi,
    int8_t* codes,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(codes, "Output codes array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        auto labels = estimator->estimator.estimate(psi->view);
        for (Size e = 0; e < n_events; ++e) {
            codes[e] = labels[e] ? static_cast<int8_t>(*labels[e])
                                 : static_cast<int8_t>(PSM_MODALITY_UNDEFINED);
        }
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_closest(
    const psm_real_t* divergences,
    int8_t* code) {

    PSM_C_API_CHECK_NULL(divergences, "Divergences array is null");
    PSM_C_API_CHECK_NULL(code, "Output code pointer is null");

    std::array<Real, md::N_MODALITIES> scores{};
    std::copy(divergences, divergences + md::N_MODALITIES, scores.begin());
    const auto best = md::closest(scores);
    *code = best ? static_cast<int8_t>(*best) : static_cast<int8_t>(PSM_MODALITY_UNDEFINED);
    PSM_C_API_RETURN_OK;
}

// =============================================================================
// Bootstrapped Estimation
// =============================================================================

PSM_EXPORT psm_error_t psm_bootstrap_config_default(psm_bootstrap_config_t* out) {
    PSM_C_API_CHECK_NULL(out, "Output config is null");

    const bs::BootstrapConfig cfg;
    out->n_iter = static_cast<int64_t>(cfg.n_iter);
    out->thresh = static_cast<psm_real_t>(cfg.thresh);
    out->min_samples = static_cast<int64_t>(cfg.min_samples);
    out->seed = cfg.seed;
    PSM_C_API_RETURN_OK;
}

PSM_EXPORT psm_error_t psm_modality_estimate_bootstrap(
    psm_estimator_t estimator,
    psm_dense_t psi,
    const psm_bootstrap_config_t* config,
    int8_t* codes,
    psm_real_t* vote_fractions,
    psm_index_t* valid_trials,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(codes, "Output codes array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        auto result = bs::estimate_bootstrap(estimator->estimator, psi->view, to_config(config));

        for (Size e = 0; e < n_events; ++e) {
            codes[e] = static_cast<int8_t>(result.assignments[e]);
        }
        if (vote_fractions != nullptr) {
            std::copy(result.vote_fractions.begin(), result.vote_fractions.end(), vote_fractions);
        }
        if (valid_trials != nullptr) {
            std::copy(result.valid_trials.begin(), result.valid_trials.end(), valid_trials);
        }
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_bootstrap_select(
    const psm_real_t* fractions,
    const psm_real_t thresh,
    int8_t* code) {

    PSM_C_API_CHECK_NULL(fractions, "Fractions array is null");
    PSM_C_API_CHECK_NULL(code, "Output code pointer is null");
    PSM_C_API_CHECK(thresh > 0 && thresh <= 1, PSM_ERROR_INVALID_ARGUMENT,
                   "thresh must be in (0, 1]");

    std::array<Real, md::N_MODALITIES> votes{};
    std::copy(fractions, fractions + md::N_MODALITIES, votes.begin());
    *code = static_cast<int8_t>(bs::select_by_votes(votes, static_cast<Real>(thresh)));
    PSM_C_API_RETURN_OK;
}

PSM_EXPORT psm_error_t psm_bootstrap_trial_indices(
    const uint64_t seed,
    const psm_index_t trial,
    psm_index_t* indices,
    psm_index_t* permutation,
    const psm_size_t n_samples) {

    PSM_C_API_CHECK_NULL(indices, "Output indices array is null");
    PSM_C_API_CHECK(trial >= 0, PSM_ERROR_INVALID_ARGUMENT, "trial must be >= 0");

    PSM_C_API_TRY
        bs::make_trial_indices(seed, static_cast<Index>(trial),
                               Array<Index>(indices, n_samples), permutation);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

// =============================================================================
// Counts
// =============================================================================

PSM_EXPORT psm_error_t psm_modality_counts(
    psm_estimator_t estimator,
    psm_dense_t psi,
    const psm_bool_t bootstrapped,
    const psm_bootstrap_config_t* config,
    psm_index_t* counts) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(counts, "Output counts array is null");

    PSM_C_API_TRY
        auto result = bs::counts(estimator->estimator, psi->view,
                                 bootstrapped != PSM_FALSE, to_config(config));
        std::copy(result.begin(), result.end(), counts);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

// =============================================================================
// Cached Estimation
// =============================================================================

PSM_EXPORT psm_error_t psm_modality_fit_transform(
    psm_estimator_t estimator,
    psm_dense_t psi,
    const psm_bool_t bootstrapped,
    const psm_bootstrap_config_t* config,
    int8_t* codes,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(codes, "Output codes array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        auto cached = estimator->cache.fit_transform(
            estimator->estimator, psi->view, bootstrapped != PSM_FALSE, to_config(config));
        std::copy(cached->begin(), cached->end(), codes);
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_cache_clear(psm_estimator_t estimator) {
    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");

    PSM_C_API_TRY
        estimator->cache.clear();
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_cache_stats(
    psm_estimator_t estimator,
    psm_size_t* size,
    uint64_t* hits,
    uint64_t* misses) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");
    PSM_C_API_CHECK_NULL(size, "Output size pointer is null");
    PSM_C_API_CHECK_NULL(hits, "Output hits pointer is null");
    PSM_C_API_CHECK_NULL(misses, "Output misses pointer is null");

    PSM_C_API_TRY
        *size = static_cast<psm_size_t>(estimator->cache.size());
        *hits = estimator->cache.hits();
        *misses = estimator->cache.misses();
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_modality_cache_set_capacity(
    psm_estimator_t estimator,
    const psm_size_t capacity) {

    PSM_C_API_CHECK_NULL(estimator, "Estimator is null");

    PSM_C_API_TRY
        estimator->cache.set_capacity(static_cast<Size>(capacity));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

} // extern "C"
