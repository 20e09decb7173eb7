#pragma once

// =============================================================================
// FILE: katz/binding/c_api/katz.h
// BRIEF: C API for Katz centrality
// =============================================================================
//
// SOLVERS:
//   - katz_centrality:       power iteration on the sparse graph
//   - katz_centrality_dense: direct solve of (I - alpha * A) x = beta
//
// CONVERGENCE:
//   - Converged when sum |x' - x| < n_nodes * tolerance
//   - Default: alpha=0.1, beta=1, tolerance=1e-6, max_iter=1000
//   - alpha must be below 1 / lambda_max of A; this is not checked
//
// BIAS:
//   - beta_per_node == NULL: every node uses the scalar beta
//   - otherwise beta_per_node[i] is the bias of node i (n_nodes entries)
//
// THREAD SAFETY:
//   - Safe on distinct outputs; graph handles are read-only here
// =============================================================================

#include "katz/binding/c_api/core/core.h"
#include "katz/binding/c_api/core/graph.h"

#ifdef __cplusplus
extern "C" {
#endif

// Katz centrality by power iteration
//   graph         [in]  Graph handle (must not permit parallel edges)
//   alpha         [in]  Attenuation factor
//   beta          [in]  Scalar bias (used when beta_per_node is NULL)
//   beta_per_node [in]  Per-node bias [n_nodes], or NULL
//   max_iter      [in]  Iteration budget (>= 0)
//   tolerance     [in]  Convergence tolerance
//   nstart        [in]  Start vector [n_nodes], or NULL for zeros
//   normalized    [in]  KATZ_TRUE for unit L2 norm
//   centrality    [out] Scores [n_nodes]
//   n_nodes       [in]  Length of centrality; must equal the node count
//   n_iter        [out] Iterations performed, or NULL
// Errors: UNSUPPORTED_GRAPH, CONVERGENCE_ERROR, DIMENSION_MISMATCH, NULL_POINTER
// On CONVERGENCE_ERROR centrality is zero-filled; on other errors it is not written.
katz_error_t katz_centrality(
    katz_graph_t graph,
    katz_real_t alpha,
    katz_real_t beta,
    const katz_real_t* beta_per_node,
    katz_index_t max_iter,
    katz_real_t tolerance,
    const katz_real_t* nstart,
    katz_bool_t normalized,
    katz_real_t* centrality,
    katz_size_t n_nodes,
    katz_index_t* n_iter
);

// Katz centrality by direct dense solve
//   graph         [in]  Graph handle (must not permit parallel edges)
//   alpha         [in]  Attenuation factor
//   beta          [in]  Scalar bias (used when beta_per_node is NULL)
//   beta_per_node [in]  Per-node bias [n_nodes], or NULL
//   normalized    [in]  KATZ_TRUE to divide by sign(sum x) * ||x||_2
//   centrality    [out] Scores [n_nodes]
//   n_nodes       [in]  Length of centrality; must equal the node count
// Errors: UNSUPPORTED_GRAPH, SINGULAR_MATRIX, NUMERICAL_ERROR, DIMENSION_MISMATCH
// On error centrality is not written.
katz_error_t katz_centrality_dense(
    katz_graph_t graph,
    katz_real_t alpha,
    katz_real_t beta,
    const katz_real_t* beta_per_node,
    katz_bool_t normalized,
    katz_real_t* centrality,
    katz_size_t n_nodes
);

#ifdef __cplusplus
}
#endif
