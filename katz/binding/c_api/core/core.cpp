// =============================================================================
// FILE: katz/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "katz/binding/c_api/core/core.h"
#include "katz/binding/c_api/core/internal.hpp"
#include "katz/core/error.hpp"
#include "katz/core/log.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace katz::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local katz_error_t g_last_error_code = KATZ_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

// =============================================================================
// Internal Error Management Functions
// =============================================================================

void set_last_error(katz_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (KATZ_LIKELY(message != nullptr)) [[likely]] {
        std::strncpy(g_last_error_message.data(), message,
                     ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else [[unlikely]] {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(katz_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = KATZ_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (KATZ_LIKELY(g_last_error_message[0] != '\0')) [[likely]] {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> katz_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

namespace {

auto report(katz_error_t code, const char* message) noexcept -> katz_error_t {
    set_last_error(code, message);
    return code;
}

} // anonymous namespace

[[nodiscard]] auto handle_exception() noexcept -> katz_error_t {
    try {
        throw;
    }
    // Argument errors (most specific first)
    catch (const IndexOutOfBoundsError& e) {
        return report(KATZ_ERROR_INDEX_OUT_OF_BOUNDS, e.what());
    }
    catch (const DimensionError& e) {
        return report(KATZ_ERROR_DIMENSION_MISMATCH, e.what());
    }
    catch (const MissingEntryError& e) {
        return report(KATZ_ERROR_MISSING_ENTRY, e.what());
    }
    catch (const ValueError& e) {
        return report(KATZ_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const OutOfMemoryError& e) {
        return report(KATZ_ERROR_OUT_OF_MEMORY, e.what());
    }
    // Numerical errors
    catch (const ConvergenceError& e) {
        return report(KATZ_ERROR_CONVERGENCE_ERROR, e.what());
    }
    catch (const SingularMatrixError& e) {
        return report(KATZ_ERROR_SINGULAR_MATRIX, e.what());
    }
    catch (const NumericalError& e) {
        return report(KATZ_ERROR_NUMERICAL_ERROR, e.what());
    }
    // Feature errors
    catch (const UnsupportedGraphError& e) {
        return report(KATZ_ERROR_UNSUPPORTED_GRAPH, e.what());
    }
    // Base katz exception
    catch (const Exception& e) {
        return report(static_cast<katz_error_t>(e.code()), e.what());
    }
    // Standard exceptions
    catch (const std::bad_alloc&) {
        return report(KATZ_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
    }
    catch (const std::length_error& e) {
        return report(KATZ_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::logic_error& e) {
        return report(KATZ_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::exception& e) {
        return report(KATZ_ERROR_UNKNOWN, e.what());
    }
    catch (...) {
        return report(KATZ_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
    }
}

} // namespace katz::binding

// =============================================================================
// C API Implementation (Stable ABI)
// =============================================================================

extern "C" {

// =============================================================================
// Version Information
// =============================================================================

KATZ_EXPORT const char* katz_get_version(void) {
    return KATZ_STRINGIFY_VALUE(KATZ_C_API_VERSION_MAJOR) "."
           KATZ_STRINGIFY_VALUE(KATZ_C_API_VERSION_MINOR) "."
           KATZ_STRINGIFY_VALUE(KATZ_C_API_VERSION_PATCH);
}

KATZ_EXPORT const char* katz_get_build_config(void) {
    static const char* config_str =
        KATZ_REAL_TYPE_NAME "+" KATZ_INDEX_TYPE_NAME
#if defined(KATZ_ONLY_SCALAR)
        "+scalar"
#elif defined(__AVX512F__)
        "+avx512"
#elif defined(__AVX2__)
        "+avx2"
#elif defined(__AVX__)
        "+avx"
#elif defined(__SSE4_2__)
        "+sse4.2"
#elif defined(__SSE2__)
        "+sse2"
#elif defined(__ARM_NEON)
        "+neon"
#else
        "+scalar"
#endif
        ;
    return config_str;
}

// =============================================================================
// Error Handling
// =============================================================================

KATZ_EXPORT const char* katz_get_last_error(void) {
    return katz::binding::get_last_error_message();
}

KATZ_EXPORT katz_error_t katz_get_last_error_code(void) {
    return katz::binding::get_last_error_code();
}

KATZ_EXPORT void katz_clear_error(void) {
    katz::binding::clear_last_error();
}

KATZ_EXPORT katz_bool_t katz_is_ok(katz_error_t code) {
    return (code == KATZ_OK) ? KATZ_TRUE : KATZ_FALSE;
}

KATZ_EXPORT katz_bool_t katz_is_error(katz_error_t code) {
    return (code != KATZ_OK) ? KATZ_TRUE : KATZ_FALSE;
}

// =============================================================================
// Logging
// =============================================================================

KATZ_EXPORT katz_error_t katz_set_log_level(int level) {
    KATZ_C_API_CHECK(level >= KATZ_LOG_TRACE && level <= KATZ_LOG_OFF,
                     KATZ_ERROR_INVALID_ARGUMENT, "Log level out of range");

    KATZ_C_API_TRY
        katz::log::set_level(static_cast<spdlog::level::level_enum>(level));
        KATZ_C_API_RETURN_OK;
    KATZ_C_API_CATCH
}

KATZ_EXPORT int katz_get_log_level(void) {
    return static_cast<int>(katz::log::level());
}

} // extern "C"
