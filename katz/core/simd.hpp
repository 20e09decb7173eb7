#pragma once

#include "katz/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(KATZ_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: katz/core/simd.hpp
// BRIEF: katz SIMD Wrapper (Google Highway)
// =============================================================================

namespace katz::simd {

    // Import Highway functions into katz::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<katz::Real>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag, ScalableTag<T>>;

} // namespace katz::simd
