#pragma once

#include "psm/config.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#if defined(PSM_USE_OPENMP)
    #include <omp.h>
#elif defined(PSM_USE_TBB)
    #include <tbb/global_control.h>
#endif

// =============================================================================
// FILE: psm/threading/scheduler.hpp
// BRIEF: Process-wide worker count for the per-event and per-trial loops
// =============================================================================
//
// Results never depend on the worker count: per-event work is independent
// and bootstrap votes are reduced serially in trial order.
// =============================================================================

namespace psm::threading {

class Scheduler {
public:
    static constexpr std::size_t MAX_THREADS = 1024;

    // At least 1
    static std::size_t hardware_concurrency() noexcept {
        const auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
        return hw > 0 ? hw : 1;
    }

    // 0 selects hardware_concurrency(), values above MAX_THREADS are clamped
    static void set_num_threads(std::size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(PSM_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));
#elif defined(PSM_USE_TBB)
        // A global_control only limits TBB while it is alive
        static std::mutex guard;
        static std::unique_ptr<tbb::global_control> limit;
        std::lock_guard<std::mutex> lock(guard);
        limit.reset();
        limit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, n);
#else
        (void)n;
#endif
    }

    static std::size_t get_num_threads() noexcept {
#if defined(PSM_USE_OPENMP)
        const int n = omp_get_max_threads();
        return n > 0 ? static_cast<std::size_t>(n) : 1;
#elif defined(PSM_USE_TBB)
        const auto n = tbb::global_control::active_value(
            tbb::global_control::max_allowed_parallelism);
        return n > 0 ? static_cast<std::size_t>(n) : 1;
#else
        return 1;
#endif
    }
};

} // namespace psm::threading
