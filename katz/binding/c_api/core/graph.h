#pragma once

// =============================================================================
// FILE: katz/binding/c_api/core/graph.h
// BRIEF: C API for weighted graph handles (CSR layout)
// =============================================================================
//
// LAYOUT:
//   Row i of the CSR arrays lists the out-edges of node i:
//     indices[indptr[i] .. indptr[i+1])  target nodes
//     weights[indptr[i] .. indptr[i+1])  edge weights (NULL = all 1)
//   Undirected graphs list each edge in both rows.
//
// OWNERSHIP:
//   katz_graph_create() copies the arrays; the caller may free its buffers
//   immediately. Release the handle with katz_graph_destroy().
// =============================================================================

#include "katz/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Opaque graph handle
typedef struct katz_graph katz_graph;
typedef katz_graph* katz_graph_t;

// Create a graph from CSR arrays
//   out        [out] New handle (set to NULL on error)
//   n_nodes    [in]  Number of nodes (>= 0)
//   nnz        [in]  Number of stored edges
//   indptr     [in]  Row offsets [n_nodes + 1] (may be NULL if n_nodes == 0)
//   indices    [in]  Target nodes [nnz]
//   weights    [in]  Edge weights [nnz], or NULL for unit weights
//   multigraph [in]  KATZ_TRUE if parallel edges are permitted
// Errors: NULL_POINTER, INVALID_ARGUMENT, DIMENSION_MISMATCH, INDEX_OUT_OF_BOUNDS
katz_error_t katz_graph_create(
    katz_graph_t* out,
    katz_index_t n_nodes,
    katz_index_t nnz,
    const katz_index_t* indptr,
    const katz_index_t* indices,
    const katz_real_t* weights,
    katz_bool_t multigraph
);

// Destroy a graph handle and set *graph to NULL (NULL-safe)
katz_error_t katz_graph_destroy(katz_graph_t* graph);

// Number of nodes
katz_error_t katz_graph_n_nodes(katz_graph_t graph, katz_index_t* out);

// Number of stored edges (CSR entries)
katz_error_t katz_graph_n_edges(katz_graph_t graph, katz_index_t* out);

// KATZ_TRUE if the graph permits parallel edges
katz_error_t katz_graph_is_multigraph(katz_graph_t graph, katz_bool_t* out);

#ifdef __cplusplus
}
#endif
