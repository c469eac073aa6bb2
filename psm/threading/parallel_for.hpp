#pragma once

#include "psm/config.hpp"
#include "psm/core/macros.hpp"
#include "psm/threading/scheduler.hpp"

#include <cstddef>
#include <exception>
#include <mutex>

#if defined(PSM_USE_TBB)
    #include <tbb/blocked_range.h>
    #include <tbb/parallel_for.h>
#elif defined(PSM_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: psm/threading/parallel_for.hpp
// BRIEF: Parallel loop over events or bootstrap trials
// =============================================================================
//
//   parallel_for(0, n_events, [&](size_t e) { ... });
//
// Iterations must be independent. A call made from inside an OpenMP region
// (an event loop nested in a bootstrap trial) runs serially on that thread.
// The first exception thrown by any iteration is rethrown to the caller.
// =============================================================================

namespace psm::threading {

namespace detail {

// Exceptions must not cross an OpenMP region boundary
class FirstException {
public:
    template <typename F>
    void capture(F&& f) noexcept {
        try {
            f();
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!error_) {
                error_ = std::current_exception();
            }
        }
    }

    void rethrow_if_any() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

} // namespace detail

template <typename Func>
inline void parallel_for(std::size_t begin, std::size_t end, Func&& func) {
    if (PSM_UNLIKELY(begin >= end)) {
        return;
    }

#if defined(PSM_USE_OPENMP)
    if (omp_in_parallel() || end - begin == 1) {
        for (std::size_t i = begin; i < end; ++i) {
            func(i);
        }
        return;
    }

    detail::FirstException first;
    #pragma omp parallel for schedule(dynamic, 16)
    for (std::size_t i = begin; i < end; ++i) {
        first.capture([&] { func(i); });
    }
    first.rethrow_if_any();

#elif defined(PSM_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<std::size_t>(begin, end),
        [&](const tbb::blocked_range<std::size_t>& r) {
            for (std::size_t i = r.begin(); i != r.end(); ++i) {
                func(i);
            }
        });

#else
    for (std::size_t i = begin; i < end; ++i) {
        func(i);
    }
#endif
}

} // namespace psm::threading
