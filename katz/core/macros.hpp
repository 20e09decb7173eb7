#pragma once

#include "katz/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: katz/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define KATZ_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define KATZ_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define KATZ_LIKELY(x)   (x)
    #define KATZ_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define KATZ_FORCE_INLINE __forceinline
    #define KATZ_RESTRICT __restrict
    #define KATZ_EXPORT __declspec(dllexport)
#else
    #define KATZ_FORCE_INLINE inline __attribute__((always_inline))
    #define KATZ_RESTRICT __restrict__
    #define KATZ_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 3: Memory Alignment
// =============================================================================

#define KATZ_ALIGNMENT 64  // 64-byte alignment for AVX-512

// =============================================================================
// SECTION 4: Optimization Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define KATZ_HOT __attribute__((hot))
#else
    #define KATZ_HOT
#endif

#define KATZ_STRINGIFY(x) #x
#define KATZ_STRINGIFY_VALUE(x) KATZ_STRINGIFY(x)
