// =============================================================================
// PSM - Assignment Cache Tests
// =============================================================================
//
// Functions tested:
//   - psm_modality_fit_transform
//   - psm_modality_cache_clear
//   - psm_modality_cache_stats
//   - psm_modality_cache_set_capacity
//
// The cache is keyed by matrix contents, so mutating the caller's buffer
// in place must never return a stale result.
//
// =============================================================================

#include "test.hpp"

extern "C" {
#include "psm/binding/c_api/modality.h"
}

#include <cstdint>
#include <vector>

using namespace psm::test;

namespace {

struct Stats {
    psm_size_t size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

Stats stats(psm_estimator_t est) {
    Stats s;
    if (psm_modality_cache_stats(est, &s.size, &s.hits, &s.misses) != PSM_OK) {
        throw std::runtime_error(psm_get_last_error());
    }
    return s;
}

std::vector<int8_t> fit(psm_estimator_t est, psm_dense_t mat, psm_size_t n_events,
                        psm_bool_t bootstrapped = PSM_FALSE,
                        const psm_bootstrap_config_t* cfg = nullptr) {
    std::vector<int8_t> codes(n_events, 99);
    if (psm_modality_fit_transform(est, mat, bootstrapped, cfg, codes.data(), n_events) != PSM_OK) {
        throw std::runtime_error(psm_get_last_error());
    }
    return codes;
}

} // namespace

PSM_TEST_BEGIN

// =============================================================================
// Hits and Misses
// =============================================================================

PSM_TEST_SUITE(lookup)

PSM_TEST_CASE(second_call_hits) {
    auto est = make_estimator();
    Random rng(61);
    EigenDense psi = random_psi(20, 8, rng, 0.1);
    auto mat = wrap(psi);

    auto first = fit(est, mat, 8);
    auto second = fit(est, mat, 8);

    PSM_ASSERT_TRUE(first == second);
    auto s = stats(est);
    PSM_ASSERT_EQ(s.size, psm_size_t(1));
    PSM_ASSERT_EQ(s.hits, uint64_t(1));
    PSM_ASSERT_EQ(s.misses, uint64_t(1));
}

PSM_TEST_CASE(matches_uncached_estimate) {
    auto est = make_estimator();
    Random rng(62);
    EigenDense psi = random_psi(15, 20, rng, 0.2);
    for (Eigen::Index r = 0; r < psi.rows(); ++r) {
        psi(r, 5) = nan_value();
    }
    auto mat = wrap(psi);

    std::vector<int8_t> direct(20);
    PSM_ASSERT_EQ(psm_modality_estimate(est, mat, direct.data(), 20), PSM_OK);
    auto cached = fit(est, mat, 20);

    PSM_ASSERT_TRUE(direct == cached);
    PSM_ASSERT_EQ(cached[5], int8_t(PSM_MODALITY_UNDEFINED));
}

PSM_TEST_CASE(mutated_input_misses) {
    auto est = make_estimator();
    EigenDense psi = constant_matrix(10, 1, 0.05);
    auto mat = wrap(psi);

    PSM_ASSERT_EQ(fit(est, mat, 1)[0], int8_t(PSM_MODALITY_EXCLUDED));

    // Same buffer, new contents
    for (Eigen::Index r = 0; r < psi.rows(); ++r) {
        psi(r, 0) = 0.95;
    }
    PSM_ASSERT_EQ(fit(est, mat, 1)[0], int8_t(PSM_MODALITY_INCLUDED));

    auto s = stats(est);
    PSM_ASSERT_EQ(s.misses, uint64_t(2));
    PSM_ASSERT_EQ(s.hits, uint64_t(0));
    PSM_ASSERT_EQ(s.size, psm_size_t(2));
}

PSM_TEST_CASE(single_value_change_misses) {
    auto est = make_estimator();
    Random rng(63);
    EigenDense psi = random_psi(30, 30, rng, 0.0);
    auto mat = wrap(psi);

    (void)fit(est, mat, 30);
    psi(17, 23) = psi(17, 23) * 0.5;
    (void)fit(est, mat, 30);

    PSM_ASSERT_EQ(stats(est).misses, uint64_t(2));
}

PSM_TEST_CASE(equal_contents_in_different_buffers_hit) {
    auto est = make_estimator();
    Random rng(64);
    EigenDense a = random_psi(10, 4, rng, 0.2);
    EigenDense b = a;
    auto mat_a = wrap(a);
    auto mat_b = wrap(b);

    (void)fit(est, mat_a, 4);
    (void)fit(est, mat_b, 4);
    PSM_ASSERT_EQ(stats(est).hits, uint64_t(1));
}

PSM_TEST_CASE(signed_zero_and_nan_payloads_share_a_key) {
    auto est = make_estimator();
    EigenDense psi = column({0.0, 0.1, nan_value()});
    auto mat = wrap(psi);
    (void)fit(est, mat, 1);

    psi(0, 0) = -0.0;
    psi(2, 0) = -nan_value();
    (void)fit(est, mat, 1);

    PSM_ASSERT_EQ(stats(est).hits, uint64_t(1));
}

PSM_TEST_CASE(mode_and_settings_are_part_of_the_key) {
    auto est = make_estimator();
    EigenDense psi = constant_matrix(12, 2, 0.9);
    auto mat = wrap(psi);

    psm_bootstrap_config_t cfg;
    PSM_ASSERT_EQ(psm_bootstrap_config_default(&cfg), PSM_OK);
    cfg.n_iter = 10;

    (void)fit(est, mat, 2, PSM_FALSE);
    auto boot = fit(est, mat, 2, PSM_TRUE, &cfg);
    PSM_ASSERT_EQ(boot[0], int8_t(PSM_MODALITY_INCLUDED));

    cfg.seed = 7;
    (void)fit(est, mat, 2, PSM_TRUE, &cfg);
    cfg.thresh = 0.9;
    (void)fit(est, mat, 2, PSM_TRUE, &cfg);

    auto s = stats(est);
    PSM_ASSERT_EQ(s.misses, uint64_t(4));
    PSM_ASSERT_EQ(s.hits, uint64_t(0));

    // Repeat of the last call
    (void)fit(est, mat, 2, PSM_TRUE, &cfg);
    PSM_ASSERT_EQ(stats(est).hits, uint64_t(1));
}

PSM_TEST_CASE(caches_are_per_estimator) {
    auto narrow = make_estimator(0.2, 0.8);
    auto wide = make_estimator(0.4, 0.8);
    EigenDense psi = constant_matrix(6, 1, 0.3);
    auto mat = wrap(psi);

    PSM_ASSERT_EQ(fit(narrow, mat, 1)[0], int8_t(PSM_MODALITY_MIDDLE));
    PSM_ASSERT_EQ(fit(wide, mat, 1)[0], int8_t(PSM_MODALITY_EXCLUDED));
}

PSM_TEST_SUITE_END

// =============================================================================
// Invalidation and Capacity
// =============================================================================

PSM_TEST_SUITE(invalidation)

PSM_TEST_CASE(clear_drops_entries) {
    auto est = make_estimator();
    EigenDense psi = constant_matrix(10, 2, 0.5);
    auto mat = wrap(psi);

    (void)fit(est, mat, 2);
    PSM_ASSERT_EQ(psm_modality_cache_clear(est), PSM_OK);
    PSM_ASSERT_EQ(stats(est).size, psm_size_t(0));

    (void)fit(est, mat, 2);
    PSM_ASSERT_EQ(stats(est).misses, uint64_t(2));
}

PSM_TEST_CASE(capacity_evicts_oldest) {
    auto est = make_estimator();
    PSM_ASSERT_EQ(psm_modality_cache_set_capacity(est, 2), PSM_OK);

    EigenDense a = constant_matrix(5, 1, 0.1);
    EigenDense b = constant_matrix(5, 1, 0.5);
    EigenDense c = constant_matrix(5, 1, 0.9);
    auto ma = wrap(a);
    auto mb = wrap(b);
    auto mc = wrap(c);

    (void)fit(est, ma, 1);
    (void)fit(est, mb, 1);
    (void)fit(est, mc, 1);
    PSM_ASSERT_EQ(stats(est).size, psm_size_t(2));

    // a was evicted, c is still there
    (void)fit(est, mc, 1);
    PSM_ASSERT_EQ(stats(est).hits, uint64_t(1));
    (void)fit(est, ma, 1);
    PSM_ASSERT_EQ(stats(est).misses, uint64_t(4));
}

PSM_TEST_CASE(shrinking_capacity_evicts) {
    auto est = make_estimator();
    for (int i = 0; i < 5; ++i) {
        EigenDense psi = constant_matrix(4, 1, 0.1 * (i + 1));
        auto mat = wrap(psi);
        (void)fit(est, mat, 1);
    }
    PSM_ASSERT_EQ(stats(est).size, psm_size_t(5));
    PSM_ASSERT_EQ(psm_modality_cache_set_capacity(est, 3), PSM_OK);
    PSM_ASSERT_EQ(stats(est).size, psm_size_t(3));
}

PSM_TEST_CASE(rejects_zero_capacity) {
    auto est = make_estimator();
    PSM_ASSERT_EQ(psm_modality_cache_set_capacity(est, 0), PSM_ERROR_INVALID_ARGUMENT);
    psm_clear_error();
}

PSM_TEST_CASE(invalid_config_is_not_cached) {
    auto est = make_estimator();
    EigenDense psi = constant_matrix(10, 1, 0.5);
    auto mat = wrap(psi);

    psm_bootstrap_config_t cfg;
    PSM_ASSERT_EQ(psm_bootstrap_config_default(&cfg), PSM_OK);
    cfg.n_iter = 0;

    int8_t code = 0;
    PSM_ASSERT_EQ(psm_modality_fit_transform(est, mat, PSM_TRUE, &cfg, &code, 1),
                  PSM_ERROR_INVALID_ARGUMENT);
    PSM_ASSERT_EQ(stats(est).size, psm_size_t(0));
    psm_clear_error();
}

PSM_TEST_SUITE_END

PSM_TEST_END

PSM_TEST_MAIN()
