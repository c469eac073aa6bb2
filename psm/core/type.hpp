#pragma once

#include "psm/config.hpp"
#include "psm/core/macros.hpp"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

// =============================================================================
// FILE: psm/core/type.hpp
// BRIEF: Scalar types, the missing-value convention and the Array view
// =============================================================================

namespace psm {

// =============================================================================
// Scalars
// =============================================================================

#if defined(PSM_USE_FLOAT32)
    using Real = float;
    constexpr const char* REAL_NAME = "float32";
#elif defined(PSM_USE_FLOAT64)
    using Real = double;
    constexpr const char* REAL_NAME = "float64";
#else
    #error "PSM: No precision macro defined."
#endif

#if defined(PSM_USE_INT32)
    using Index = std::int32_t;
    constexpr const char* INDEX_NAME = "int32";
#elif defined(PSM_USE_INT64)
    using Index = std::int64_t;
    constexpr const char* INDEX_NAME = "int64";
#else
    #error "PSM: No index precision selected."
#endif

using Size = std::size_t;
using Byte = std::uint8_t;

// =============================================================================
// Missing PSI Values
// =============================================================================

// A sample with no junction reads for an event carries NaN. Kernels never
// treat NaN as an error, they skip it.

constexpr Real MISSING = std::numeric_limits<Real>::quiet_NaN();

PSM_FORCE_INLINE bool is_missing(Real v) noexcept {
    return std::isnan(v);
}

PSM_FORCE_INLINE bool is_present(Real v) noexcept {
    return !std::isnan(v);
}

// =============================================================================
// Array View
// =============================================================================

/// Non-owning contiguous view, the pointer must outlive the view
template <typename T>
struct Array {
    using value_type = T;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size n) noexcept : ptr(p), len(n) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    PSM_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];
    }

    [[nodiscard]] constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] constexpr auto end() const noexcept -> T* { return ptr + len; }
};

static_assert(std::is_trivially_copyable_v<Array<const Real>>);

} // namespace psm
