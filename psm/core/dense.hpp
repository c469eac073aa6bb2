#pragma once

#include "psm/core/type.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"

#include <type_traits>

// =============================================================================
// FILE: psm/core/dense.hpp
// BRIEF: Row-major strided matrix view
// =============================================================================
//
// PSI input is samples (rows) x events (columns). Kernel outputs reuse the
// same view with bins or modalities as rows and events as columns, so a
// per-event result always lives in one column.
//
// The view never owns its buffer. A stride wider than cols selects a
// sub-block of a larger caller matrix.
// =============================================================================

namespace psm {

template <typename T>
struct DenseArray {
    using ValueType = T;

    T* ptr;
    Index rows;
    Index cols;
    Index stride;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0), stride(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c), stride(c) {}

    constexpr DenseArray(T* p, Index r, Index c, Index s) noexcept
        : ptr(p), rows(r), cols(c), stride(s) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr DenseArray(const DenseArray<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols), stride(other.stride) {}

    [[nodiscard]] PSM_FORCE_INLINE T& operator()(Index r, Index c) const {
#if !defined(NDEBUG)
        PSM_ASSERT(r >= 0 && r < rows && c >= 0 && c < cols, "DenseArray: index out of bounds");
#endif
        return ptr[r * stride + c];
    }

    [[nodiscard]] PSM_FORCE_INLINE Array<T> row(Index r) const {
#if !defined(NDEBUG)
        PSM_ASSERT(r >= 0 && r < rows, "DenseArray: row out of bounds");
#endif
        return Array<T>(ptr + r * stride, static_cast<Size>(cols));
    }

    [[nodiscard]] constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }

    [[nodiscard]] constexpr bool is_contiguous() const noexcept { return stride == cols; }
};

static_assert(std::is_trivially_copyable_v<DenseArray<const Real>>);

} // namespace psm
