// =============================================================================
// FILE: katz/binding/c_api/katz.cpp
// BRIEF: C API implementation for Katz centrality
// =============================================================================

#include "katz/binding/c_api/katz.h"
#include "katz/binding/c_api/core/internal.hpp"
#include "katz/kernel/katz.hpp"
#include "katz/core/type.hpp"
#include "katz/core/error.hpp"

#include <vector>

using namespace katz;
using namespace katz::binding;

namespace {

// Scalar beta is broadcast; otherwise the caller's array is viewed in place.
auto bias_column(Real beta, const Real* beta_per_node, Size n,
                 std::vector<Real>& storage) -> Array<const Real> {
    if (beta_per_node != nullptr) {
        return Array<const Real>(beta_per_node, n);
    }
    storage.assign(n, beta);
    return as_array(static_cast<const std::vector<Real>&>(storage));
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Katz Centrality (Power Iteration)
// =============================================================================

KATZ_EXPORT katz_error_t katz_centrality(
    katz_graph_t graph,
    const katz_real_t alpha,
    const katz_real_t beta,
    const katz_real_t* beta_per_node,
    const katz_index_t max_iter,
    const katz_real_t tolerance,
    const katz_real_t* nstart,
    const katz_bool_t normalized,
    katz_real_t* centrality,
    const katz_size_t n_nodes,
    katz_index_t* n_iter) {

    KATZ_C_API_CHECK_NULL(graph, "Graph handle is null");
    KATZ_C_API_CHECK(!graph->multigraph, KATZ_ERROR_UNSUPPORTED_GRAPH,
                     "Katz centrality is not defined for multigraphs");
    KATZ_C_API_CHECK(n_nodes == static_cast<katz_size_t>(graph->n_nodes),
                     KATZ_ERROR_DIMENSION_MISMATCH,
                     "n_nodes does not match the graph");
    if (n_nodes > 0) {
        KATZ_C_API_CHECK_NULL(centrality, "Output centrality array is null");
    }

    KATZ_C_API_TRY
        std::vector<Real> beta_storage;
        auto bias = bias_column(beta, beta_per_node, n_nodes, beta_storage);
        Array<const Real> start = (nstart != nullptr)
            ? Array<const Real>(nstart, n_nodes)
            : Array<const Real>();

        const Index iterations = kernel::centrality::katz_centrality(
            graph->view(),
            Array<Real>(centrality, n_nodes),
            alpha,
            bias,
            max_iter,
            tolerance,
            start,
            normalized != KATZ_FALSE
        );

        if (n_iter != nullptr) {
            *n_iter = iterations;
        }
        KATZ_C_API_RETURN_OK;
    KATZ_C_API_CATCH
}

// =============================================================================
// Katz Centrality (Direct Dense Solve)
// =============================================================================

KATZ_EXPORT katz_error_t katz_centrality_dense(
    katz_graph_t graph,
    const katz_real_t alpha,
    const katz_real_t beta,
    const katz_real_t* beta_per_node,
    const katz_bool_t normalized,
    katz_real_t* centrality,
    const katz_size_t n_nodes) {

    KATZ_C_API_CHECK_NULL(graph, "Graph handle is null");
    KATZ_C_API_CHECK(!graph->multigraph, KATZ_ERROR_UNSUPPORTED_GRAPH,
                     "Katz centrality is not defined for multigraphs");
    KATZ_C_API_CHECK(n_nodes == static_cast<katz_size_t>(graph->n_nodes),
                     KATZ_ERROR_DIMENSION_MISMATCH,
                     "n_nodes does not match the graph");
    if (n_nodes > 0) {
        KATZ_C_API_CHECK_NULL(centrality, "Output centrality array is null");
    }

    KATZ_C_API_TRY
        std::vector<Real> beta_storage;
        auto bias = bias_column(beta, beta_per_node, n_nodes, beta_storage);

        kernel::centrality::katz_centrality_dense(
            graph->view(),
            Array<Real>(centrality, n_nodes),
            alpha,
            bias,
            normalized != KATZ_FALSE
        );

        KATZ_C_API_RETURN_OK;
    KATZ_C_API_CATCH
}

} // extern "C"
