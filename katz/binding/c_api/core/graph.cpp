// =============================================================================
// FILE: katz/binding/c_api/core/graph.cpp
// BRIEF: C API implementation for graph handles
// =============================================================================

#include "katz/binding/c_api/core/graph.h"
#include "katz/binding/c_api/core/internal.hpp"
#include "katz/core/graph.hpp"
#include "katz/core/error.hpp"

#include <memory>

using namespace katz;
using namespace katz::binding;

extern "C" {

KATZ_EXPORT katz_error_t katz_graph_create(
    katz_graph_t* out,
    const katz_index_t n_nodes,
    const katz_index_t nnz,
    const katz_index_t* indptr,
    const katz_index_t* indices,
    const katz_real_t* weights,
    const katz_bool_t multigraph) {

    KATZ_C_API_CHECK_NULL(out, "Output graph handle pointer is null");
    *out = nullptr;

    KATZ_C_API_CHECK(n_nodes >= 0, KATZ_ERROR_INVALID_ARGUMENT,
                     "Number of nodes must be non-negative");
    KATZ_C_API_CHECK(nnz >= 0, KATZ_ERROR_INVALID_ARGUMENT,
                     "Number of edges must be non-negative");
    if (n_nodes > 0) {
        KATZ_C_API_CHECK_NULL(indptr, "indptr is null");
    }
    if (nnz > 0) {
        KATZ_C_API_CHECK_NULL(indices, "indices is null");
    }

    KATZ_C_API_TRY
        auto graph = std::make_unique<katz_graph>();
        graph->n_nodes = n_nodes;
        graph->multigraph = (multigraph != KATZ_FALSE);

        if (n_nodes > 0) {
            const auto n_offsets = static_cast<Size>(n_nodes) + 1;
            const auto n_entries = static_cast<Size>(nnz);

            graph->indptr.assign(indptr, indptr + n_offsets);
            graph->indices.assign(indices, indices + n_entries);
            if (weights != nullptr) {
                graph->values.assign(weights, weights + n_entries);
            } else {
                graph->values.assign(n_entries, Real(1));
            }

            KATZ_CHECK_DIM(graph->indptr.back() == nnz,
                           "indptr[n_nodes] must equal nnz");
        } else {
            KATZ_CHECK_DIM(nnz == 0, "A graph without nodes cannot have edges");
        }

        graph->view().validate();
        if (!graph->multigraph && has_parallel_edges(graph->view())) {
            throw UnsupportedGraphError(
                "Graph repeats an edge but was not created as a multigraph");
        }

        *out = graph.release();
        KATZ_C_API_RETURN_OK;
    KATZ_C_API_CATCH
}

KATZ_EXPORT katz_error_t katz_graph_destroy(katz_graph_t* graph) {
    KATZ_C_API_CHECK_NULL(graph, "Graph handle pointer is null");

    delete *graph;
    *graph = nullptr;
    KATZ_C_API_RETURN_OK;
}

KATZ_EXPORT katz_error_t katz_graph_n_nodes(katz_graph_t graph, katz_index_t* out) {
    KATZ_C_API_CHECK_NULL(graph, "Graph handle is null");
    KATZ_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = graph->n_nodes;
    KATZ_C_API_RETURN_OK;
}

KATZ_EXPORT katz_error_t katz_graph_n_edges(katz_graph_t graph, katz_index_t* out) {
    KATZ_C_API_CHECK_NULL(graph, "Graph handle is null");
    KATZ_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = graph->view().num_edges();
    KATZ_C_API_RETURN_OK;
}

KATZ_EXPORT katz_error_t katz_graph_is_multigraph(katz_graph_t graph, katz_bool_t* out) {
    KATZ_C_API_CHECK_NULL(graph, "Graph handle is null");
    KATZ_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = graph->multigraph ? KATZ_TRUE : KATZ_FALSE;
    KATZ_C_API_RETURN_OK;
}

} // extern "C"
