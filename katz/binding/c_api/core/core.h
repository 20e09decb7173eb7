#pragma once

// =============================================================================
// FILE: katz/binding/c_api/core/core.h
// BRIEF: C ABI for katz-core
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for FFI and cross-language bindings
//   - Opaque handles (no C++ types exposed)
//   - Thread-safe error reporting via thread-local storage
//   - Compatible with C99 and C++11+
//
// ABI STABILITY GUARANTEE:
//   - Error codes are stable across versions
//   - Handle types remain opaque
//   - Function signatures will not change within a major version
//
// MEMORY MODEL:
//   - Handles are created by katz_*_create() and released by katz_*_destroy()
//   - Handles copy their input arrays; callers keep ownership of their buffers
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define KATZ_C_API_VERSION_MAJOR 1
#define KATZ_C_API_VERSION_MINOR 0
#define KATZ_C_API_VERSION_PATCH 0

// =============================================================================
// Export Macro (Platform-Specific DLL/SO Symbol Visibility)
// =============================================================================

#ifndef KATZ_EXPORT
#if defined(_MSC_VER)
    #define KATZ_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define KATZ_EXPORT __attribute__((visibility("default")))
#else
    #define KATZ_EXPORT
#endif
#endif

// Get runtime version string (e.g., "1.0.0")
const char* katz_get_version(void);

// Get build configuration (e.g., "float64+int64+avx2")
const char* katz_get_build_config(void);

// =============================================================================
// Basic Value Types (Must Match C++ katz::Real and katz::Index)
// =============================================================================

// Real type: KATZ_PRECISION 0 = float32, 1 = float64 (default)
#if defined(KATZ_USE_FLOAT32) || (defined(KATZ_PRECISION) && KATZ_PRECISION == 0)
typedef float katz_real_t;
#define KATZ_REAL_TYPE_NAME "float32"
#else
typedef double katz_real_t;
#define KATZ_REAL_TYPE_NAME "float64"
#endif

// Index type: KATZ_INDEX_PRECISION 0 = int32, 1 = int64 (default)
#if defined(KATZ_USE_INT32) || (defined(KATZ_INDEX_PRECISION) && KATZ_INDEX_PRECISION == 0)
typedef int32_t katz_index_t;
#define KATZ_INDEX_TYPE_NAME "int32"
#else
typedef int64_t katz_index_t;
#define KATZ_INDEX_TYPE_NAME "int64"
#endif

typedef size_t katz_size_t;

typedef int katz_bool_t;
#define KATZ_TRUE 1
#define KATZ_FALSE 0

// =============================================================================
// Error Handling (Thread-Safe)
// =============================================================================

// Error codes (stable across versions, matches katz::ErrorCode)
typedef int32_t katz_error_t;

// Success
#define KATZ_OK 0

// General errors (1-9)
#define KATZ_ERROR_UNKNOWN 1
#define KATZ_ERROR_INTERNAL 2
#define KATZ_ERROR_OUT_OF_MEMORY 3
#define KATZ_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define KATZ_ERROR_INVALID_ARGUMENT 10
#define KATZ_ERROR_DIMENSION_MISMATCH 11
#define KATZ_ERROR_INDEX_OUT_OF_BOUNDS 14
#define KATZ_ERROR_MISSING_ENTRY 15

// Feature errors (40-49)
#define KATZ_ERROR_UNSUPPORTED_GRAPH 42

// Numerical errors (50-59)
#define KATZ_ERROR_NUMERICAL_ERROR 50
#define KATZ_ERROR_CONVERGENCE_ERROR 54
#define KATZ_ERROR_SINGULAR_MATRIX 55

// Get human-readable error message for last error (thread-local)
// Returns "No error" if no error has occurred
const char* katz_get_last_error(void);

// Get last error code (thread-local)
katz_error_t katz_get_last_error_code(void);

// Clear last error (thread-local)
void katz_clear_error(void);

// KATZ_TRUE if code == KATZ_OK
katz_bool_t katz_is_ok(katz_error_t code);

// KATZ_TRUE if code != KATZ_OK
katz_bool_t katz_is_error(katz_error_t code);

// =============================================================================
// Logging
// =============================================================================

// Log levels of the "katz" logger (match spdlog::level)
#define KATZ_LOG_TRACE 0
#define KATZ_LOG_DEBUG 1
#define KATZ_LOG_INFO 2
#define KATZ_LOG_WARN 3
#define KATZ_LOG_ERROR 4
#define KATZ_LOG_CRITICAL 5
#define KATZ_LOG_OFF 6

// Set the level of the "katz" logger
// Returns KATZ_ERROR_INVALID_ARGUMENT if level is outside [KATZ_LOG_TRACE, KATZ_LOG_OFF]
katz_error_t katz_set_log_level(int level);

// Get the current level of the "katz" logger
int katz_get_log_level(void);

#ifdef __cplusplus
}
#endif
