#pragma once

// =============================================================================
// FILE: katz/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ wrappers for the C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
// =============================================================================

#include "katz/binding/c_api/core/core.h"
#include "katz/binding/c_api/core/graph.h"
#include "katz/core/graph.hpp"
#include "katz/core/error.hpp"
#include "katz/core/type.hpp"

#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace katz::binding {

static_assert(std::is_same_v<katz_real_t, Real>,
              "katz_real_t must match katz::Real");
static_assert(std::is_same_v<katz_index_t, Index>,
              "katz_index_t must match katz::Index");

// =============================================================================
// Internal Graph Wrapper
// =============================================================================

/// @brief Owning CSR storage behind a katz_graph handle.
struct GraphWrapper {
    std::vector<Index> indptr;
    std::vector<Index> indices;
    std::vector<Real> values;
    Index n_nodes = 0;
    bool multigraph = false;

    GraphWrapper() = default;

    GraphWrapper(const GraphWrapper&) = delete;
    GraphWrapper& operator=(const GraphWrapper&) = delete;

    GraphWrapper(GraphWrapper&&) noexcept = default;
    GraphWrapper& operator=(GraphWrapper&&) noexcept = default;

    ~GraphWrapper() = default;

    /// @brief Non-owning view; valid while the wrapper is alive and unmodified.
    [[nodiscard]] auto view() const noexcept -> CSRGraph {
        return CSRGraph(n_nodes, as_array(indptr), as_array(indices),
                        as_array(values), multigraph);
    }
};

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(katz_error_t code, const char* message) noexcept;

void set_last_error(katz_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> katz_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert the active C++ exception to a C error code.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> katz_error_t;

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define KATZ_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (KATZ_UNLIKELY((ptr) == nullptr)) { \
            katz::binding::set_last_error(KATZ_ERROR_NULL_POINTER, (msg)); \
            return KATZ_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define KATZ_C_API_CHECK(cond, code, msg) \
    do { \
        if (KATZ_UNLIKELY(!(cond))) { \
            katz::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define KATZ_C_API_TRY try {

#define KATZ_C_API_CATCH \
    } catch (...) { \
        return katz::binding::handle_exception(); \
    }

#define KATZ_C_API_RETURN_OK \
    do { \
        katz::binding::clear_last_error(); \
        return KATZ_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace katz::binding

// =============================================================================
// Opaque Handle Definitions (C ABI Compatibility)
// =============================================================================

// Completes the forward declaration in graph.h
struct katz_graph : katz::binding::GraphWrapper {
    using GraphWrapper::GraphWrapper;
};

static_assert(std::is_base_of_v<katz::binding::GraphWrapper, katz_graph>,
              "katz_graph must inherit from GraphWrapper");
static_assert(!std::is_copy_constructible_v<katz_graph>,
              "katz_graph must not be copyable");
