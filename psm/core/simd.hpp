#pragma once

#include "psm/core/type.hpp"

#include <type_traits>

// =============================================================================
// FILE: psm/core/simd.hpp
// BRIEF: Highway with static dispatch, imported as psm::simd
// =============================================================================
//
// One target is chosen at compile time. PSM_ONLY_SCALAR (see config.hpp)
// restricts it to the portable scalar lanes.
// =============================================================================

#if defined(PSM_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#include <hwy/highway.h>
#include <hwy/contrib/math/math-inl.h>

namespace psm::simd {

using namespace hwy::HWY_NAMESPACE;

// Full-width vector of T for the compiled target
template <typename T>
using Tag = ScalableTag<T>;

} // namespace psm::simd
