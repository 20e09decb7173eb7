#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: katz/config.hpp
// BRIEF: katz-core Configuration Header
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef KATZ_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define KATZ_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define KATZ_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define KATZ_OS_LINUX
#else
    #define KATZ_OS_UNKNOWN
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default, centrality scores are compared against 1e-6 tolerances)
#ifndef KATZ_PRECISION
    #define KATZ_PRECISION 1
#endif

#if KATZ_PRECISION == 0
    #define KATZ_USE_FLOAT32
#elif KATZ_PRECISION == 1
    #define KATZ_USE_FLOAT64
#else
    #error "KATZ Configuration Error: Invalid KATZ_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 0: int32 - Max 2B nodes
// 1: int64 - NumPy-compatible (default)
#ifndef KATZ_INDEX_PRECISION
    #define KATZ_INDEX_PRECISION 1
#endif

#if KATZ_INDEX_PRECISION == 0
    #define KATZ_USE_INT32
#elif KATZ_INDEX_PRECISION == 1
    #define KATZ_USE_INT64
#else
    #error "KATZ Configuration Error: Invalid KATZ_INDEX_PRECISION value. " \
           "Must be 0 (int32) or 1 (int64)."
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

namespace katz::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512 register width
}

// =============================================================================
// Logging Configuration
// =============================================================================

// Environment variable read once when the "katz" logger is created
#define KATZ_LOG_LEVEL_ENV "KATZ_LOG_LEVEL"
#define KATZ_LOGGER_NAME "katz"
