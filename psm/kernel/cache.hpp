#pragma once

#include "psm/config.hpp"
#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/log.hpp"
#include "psm/core/macros.hpp"
#include "psm/kernel/bootstrap.hpp"
#include "psm/kernel/modality.hpp"

#include <atomic>
#include <bit>
#include <cmath>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: psm/kernel/cache.hpp
// BRIEF: Content-keyed cache of modality assignments
// =============================================================================
//
// Keys are computed from the full matrix contents, the estimator edges and
// the estimation settings, so a changed value always produces a new key.
// Entries are immutable once published and handed out as shared_ptr<const>.
// Oldest entries are evicted first once the capacity is exceeded.
// =============================================================================

namespace psm::kernel::cache {

using modality::Modality;
using modality::ModalityEstimator;
using bootstrap::BootstrapConfig;

// Per-event modality code, -1 for an undefined single-pass event
using Codes = std::vector<std::int8_t>;

constexpr std::int8_t UNDEFINED_CODE = -1;

namespace config {
    constexpr Size DEFAULT_CAPACITY = 64;   // entries per estimator
}

// =============================================================================
// Content Key
// =============================================================================

/// @brief 128-bit content fingerprint plus the matrix shape.
struct CacheKey {
    std::uint64_t h1 = 0;
    std::uint64_t h2 = 0;
    Index rows = 0;
    Index cols = 0;

    [[nodiscard]] auto operator==(const CacheKey&) const noexcept -> bool = default;
};

struct CacheKeyHash {
    auto operator()(const CacheKey& k) const noexcept -> std::size_t {
        return static_cast<std::size_t>(k.h1 ^ (k.h2 * 0x9e3779b97f4a7c15ULL));
    }
};

namespace detail {

PSM_FORCE_INLINE std::uint64_t mix64(std::uint64_t x) noexcept {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

// Two independent streams over the same words
class KeyBuilder {
public:
    void add(std::uint64_t word) noexcept {
        h1_ = mix64(h1_ ^ word) + 0x9e3779b97f4a7c15ULL;
        h2_ = (h2_ ^ word) * 0x100000001b3ULL;
        h2_ ^= h2_ >> 29;
    }

    void add_real(Real v) noexcept {
        // All NaN payloads hash as one missing marker, -0.0 as +0.0
        if (is_missing(v)) {
            add(0x7ff8dead7ff8deadULL);
            return;
        }
        const double d = (v == Real(0)) ? 0.0 : static_cast<double>(v);
        add(std::bit_cast<std::uint64_t>(d));
    }

    [[nodiscard]] auto h1() const noexcept -> std::uint64_t { return mix64(h1_); }
    [[nodiscard]] auto h2() const noexcept -> std::uint64_t { return mix64(h2_); }

private:
    std::uint64_t h1_ = 0x243f6a8885a308d3ULL;
    std::uint64_t h2_ = 0xcbf29ce484222325ULL;
};

} // namespace detail

[[nodiscard]] inline auto content_key(
    const ModalityEstimator& estimator,
    const DenseArray<const Real>& psi,
    bool bootstrapped,
    const BootstrapConfig& cfg
) -> CacheKey {
    detail::KeyBuilder kb;

    kb.add(static_cast<std::uint64_t>(psi.rows));
    kb.add(static_cast<std::uint64_t>(psi.cols));
    for (Index r = 0; r < psi.rows; ++r) {
        auto row = psi.row(r);
        for (Size c = 0; c < row.len; ++c) {
            kb.add_real(row.ptr[c]);
        }
    }

    for (Real e : estimator.edges()) {
        kb.add_real(e);
    }

    kb.add(bootstrapped ? 1 : 0);
    if (bootstrapped) {
        kb.add(static_cast<std::uint64_t>(cfg.n_iter));
        kb.add_real(cfg.thresh);
        kb.add(static_cast<std::uint64_t>(cfg.min_samples));
        kb.add(cfg.seed);
    }

    return CacheKey{kb.h1(), kb.h2(), psi.rows, psi.cols};
}

// =============================================================================
// Cache
// =============================================================================

class ModalityCache {
public:
    explicit ModalityCache(Size capacity = config::DEFAULT_CAPACITY)
        : capacity_(capacity) {
        PSM_CHECK_ARG(capacity_ >= 1, "ModalityCache: capacity must be >= 1");
    }

    ModalityCache(const ModalityCache&) = delete;
    auto operator=(const ModalityCache&) -> ModalityCache& = delete;

    /// @brief Cached single-pass or bootstrapped assignment codes.
    ///
    /// Computes and publishes on a miss. Two threads missing on the same key
    /// may both compute, the first one published wins.
    auto fit_transform(
        const ModalityEstimator& estimator,
        const DenseArray<const Real>& psi,
        bool bootstrapped,
        const BootstrapConfig& cfg = {}
    ) -> std::shared_ptr<const Codes> {
        if (bootstrapped) {
            cfg.validate();
        }

        const CacheKey key = content_key(estimator, psi, bootstrapped, cfg);

        {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                log::logger().trace("cache: hit ({} x {})", psi.rows, psi.cols);
                return it->second;
            }
        }

        misses_.fetch_add(1, std::memory_order_relaxed);
        log::logger().debug("cache: miss ({} x {}, bootstrapped={})",
                            psi.rows, psi.cols, bootstrapped);

        auto computed = std::make_shared<const Codes>(compute(estimator, psi, bootstrapped, cfg));

        std::unique_lock lock(mutex_);
        auto [it, inserted] = entries_.emplace(key, computed);
        if (!inserted) {
            return it->second;
        }
        order_.push_back(key);
        evict_unlocked();
        return computed;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
        order_.clear();
    }

    [[nodiscard]] auto size() const -> Size {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    void set_capacity(Size capacity) {
        PSM_CHECK_ARG(capacity >= 1, "ModalityCache: capacity must be >= 1");
        std::unique_lock lock(mutex_);
        capacity_ = capacity;
        evict_unlocked();
    }

    [[nodiscard]] auto hits() const noexcept -> std::uint64_t {
        return hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto misses() const noexcept -> std::uint64_t {
        return misses_.load(std::memory_order_relaxed);
    }

private:
    static auto compute(
        const ModalityEstimator& estimator,
        const DenseArray<const Real>& psi,
        bool bootstrapped,
        const BootstrapConfig& cfg
    ) -> Codes {
        Codes codes(static_cast<Size>(psi.cols), UNDEFINED_CODE);
        if (bootstrapped) {
            auto result = bootstrap::estimate_bootstrap(estimator, psi, cfg);
            for (Size e = 0; e < codes.size(); ++e) {
                codes[e] = static_cast<std::int8_t>(result.assignments[e]);
            }
        } else {
            auto result = estimator.estimate(psi);
            for (Size e = 0; e < codes.size(); ++e) {
                if (result[e]) {
                    codes[e] = static_cast<std::int8_t>(*result[e]);
                }
            }
        }
        return codes;
    }

    void evict_unlocked() {
        while (entries_.size() > capacity_ && !order_.empty()) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<CacheKey, std::shared_ptr<const Codes>, CacheKeyHash> entries_;
    std::deque<CacheKey> order_;
    Size capacity_;
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
};

} // namespace psm::kernel::cache
