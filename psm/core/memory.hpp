#pragma once

#include "psm/core/type.hpp"
#include "psm/core/macros.hpp"
#include "psm/core/error.hpp"
#include <cstddef>
#include <memory>
#include <new>
#include <string>
#include <type_traits>

// =============================================================================
// FILE: psm/core/memory.hpp
// BRIEF: Aligned scratch buffers for kernels
// =============================================================================
//
// Per-call and per-trial working storage (bin fractions, packed columns,
// bootstrap resamples, vote tables). Buffers are zero-initialized and
// aligned for the widest Highway vector.
// =============================================================================

namespace psm::memory {

inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;

template <typename T>
struct AlignedDeleter {
    std::size_t alignment = DEFAULT_ALIGNMENT;

    void operator()(T* ptr) const noexcept {
        operator delete[](ptr, std::align_val_t(alignment));
    }
};

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
template <typename T>
using Scratch = std::unique_ptr<T[], AlignedDeleter<T>>;

// Throws OutOfMemoryError, never returns null for count > 0
template <typename T>
auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> Scratch<T> {
    static_assert(std::is_arithmetic_v<T>, "aligned_alloc: T must be arithmetic");

    if (count == 0) {
        return Scratch<T>(nullptr, AlignedDeleter<T>{alignment});
    }
    try {
        return Scratch<T>(new (std::align_val_t(alignment)) T[count](), AlignedDeleter<T>{alignment});
    } catch (const std::bad_alloc&) {
        throw OutOfMemoryError("aligned_alloc: cannot allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }
}

} // namespace psm::memory
