// =============================================================================
// FILE: katz/kernel/katz.h
// BRIEF: API reference for Katz centrality
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "katz/core/type.hpp"
#include "katz/core/graph.hpp"
#include "katz/kernel/beta.hpp"

#include <optional>

namespace katz::kernel::centrality {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Real DEFAULT_ALPHA = Real(0.1);
    constexpr Real DEFAULT_BETA = Real(1.0);
    constexpr Index DEFAULT_MAX_ITER = 1000;
    constexpr Real DEFAULT_TOLERANCE = Real(1e-6);
}

// =============================================================================
// Array Kernels
// =============================================================================

/* -----------------------------------------------------------------------------
 * FUNCTION: katz_centrality (CSR)
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Power iteration for x = alpha * A * x + beta on a CSR graph.
 *
 * PARAMETERS:
 *     graph      [in]  Simple graph, row i = out-edges of node i
 *     centrality [out] Katz scores [n_nodes]
 *     alpha      [in]  Attenuation factor
 *     beta       [in]  Per-node bias [n_nodes]
 *     max_iter   [in]  Iteration budget (>= 0)
 *     tol        [in]  Converged when sum |x' - x| < n_nodes * tol
 *     nstart     [in]  Start vector [n_nodes], or empty for zeros
 *     normalized [in]  If true, scale to unit L2 norm
 *
 * PRECONDITIONS:
 *     - !graph.is_multigraph()            else UnsupportedGraphError
 *     - centrality.len >= n_nodes         else DimensionError
 *     - beta.len == n_nodes               else DimensionError
 *     - nstart empty or nstart.len == n_nodes
 *     - alpha < 1 / lambda_max (not checked)
 *
 * POSTCONDITIONS:
 *     - Returns the number of iterations performed
 *     - Each iterate is computed from the previous one only
 *     - A zero vector is left unscaled by normalization
 *
 * ERRORS:
 *     ConvergenceError(max_iter) if the budget is exhausted; the first
 *     n_nodes entries of centrality are then zero
 *
 * COMPLEXITY:
 *     Time:  O(iterations * (nnz + n_nodes))
 *     Space: O(n_nodes) auxiliary
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 * -------------------------------------------------------------------------- */
Index katz_centrality(
    const CSRGraph& graph,                      // Simple graph
    Array<Real> centrality,                     // Output scores [n_nodes]
    Real alpha,                                 // Attenuation factor
    Array<const Real> beta,                     // Bias [n_nodes]
    Index max_iter = config::DEFAULT_MAX_ITER,  // Max iterations
    Real tol = config::DEFAULT_TOLERANCE,       // Convergence tolerance
    Array<const Real> nstart = {},              // Start vector or empty
    bool normalized = true                      // Unit L2 norm
);

/* -----------------------------------------------------------------------------
 * FUNCTION: katz_centrality_dense (CSR)
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Solve (I - alpha * A) x = beta with a dense full-pivot LU (Eigen).
 *
 * PARAMETERS:
 *     graph      [in]  Simple graph, row i = out-edges of node i
 *     centrality [out] Katz scores [n_nodes]
 *     alpha      [in]  Attenuation factor
 *     beta       [in]  Per-node bias [n_nodes]
 *     normalized [in]  If true, divide by sign(sum x) * ||x||_2
 *
 * PRECONDITIONS:
 *     - !graph.is_multigraph()            else UnsupportedGraphError
 *     - beta.len == n_nodes               else DimensionError
 *
 * POSTCONDITIONS:
 *     - A zero signed norm leaves x unscaled
 *
 * ERRORS:
 *     SingularMatrixError  I - alpha * A is not invertible
 *     NumericalError       the solution contains inf or NaN
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes^3)
 *     Space: O(n_nodes^2)
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 * -------------------------------------------------------------------------- */
void katz_centrality_dense(
    const CSRGraph& graph,                      // Simple graph
    Array<Real> centrality,                     // Output scores [n_nodes]
    Real alpha,                                 // Attenuation factor
    Array<const Real> beta,                     // Bias [n_nodes]
    bool normalized = true                      // Signed L2 normalization
);

// =============================================================================
// Node-Keyed Front Ends
// =============================================================================

/* -----------------------------------------------------------------------------
 * FUNCTION: katz_centrality (GraphLike)
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Power iteration on any GraphLike graph; returns node -> score.
 *
 * PARAMETERS:
 *     graph      [in]  GraphLike graph
 *     alpha      [in]  Attenuation factor (default 0.1)
 *     beta       [in]  Scalar, positional sequence or node mapping (default 1)
 *     max_iter   [in]  Iteration budget (default 1000)
 *     tol        [in]  Tolerance (default 1e-6)
 *     nstart     [in]  Optional node -> start value mapping
 *     normalized [in]  Unit L2 norm (default true)
 *
 * POSTCONDITIONS:
 *     - One entry per node; empty graph gives an empty map
 *
 * ERRORS:
 *     UnsupportedGraphError, ConvergenceError, MissingBetaEntryError,
 *     MissingEntryError (nstart), DimensionError (beta sequence too long)
 * -------------------------------------------------------------------------- */
template <GraphLike G>
ScoreMap<NodeIdOf<G>> katz_centrality(
    const G& graph,
    Real alpha = config::DEFAULT_ALPHA,
    const Beta<NodeIdOf<G>>& beta = config::DEFAULT_BETA,
    Index max_iter = config::DEFAULT_MAX_ITER,
    Real tol = config::DEFAULT_TOLERANCE,
    const std::optional<ScoreMap<NodeIdOf<G>>>& nstart = std::nullopt,
    bool normalized = true
);

/* -----------------------------------------------------------------------------
 * FUNCTION: katz_centrality_dense (GraphLike)
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Direct dense solve on any GraphLike graph; returns node -> score.
 *
 * ERRORS:
 *     UnsupportedGraphError, SingularMatrixError, NumericalError,
 *     MissingBetaEntryError, DimensionError (beta sequence too long)
 * -------------------------------------------------------------------------- */
template <GraphLike G>
ScoreMap<NodeIdOf<G>> katz_centrality_dense(
    const G& graph,
    Real alpha = config::DEFAULT_ALPHA,
    const Beta<NodeIdOf<G>>& beta = config::DEFAULT_BETA,
    bool normalized = true
);

} // namespace katz::kernel::centrality
