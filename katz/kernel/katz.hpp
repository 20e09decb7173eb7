#pragma once

#include "katz/core/type.hpp"
#include "katz/core/simd.hpp"
#include "katz/core/graph.hpp"
#include "katz/core/error.hpp"
#include "katz/core/macros.hpp"
#include "katz/core/memory.hpp"
#include "katz/core/log.hpp"
#include "katz/kernel/beta.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =============================================================================
// FILE: katz/kernel/katz.hpp
// BRIEF: Katz centrality (power iteration and direct dense solve)
//
// Two layers:
// - Array kernels on a CSRGraph, writing into caller buffers.
// - Node-keyed front ends on any GraphLike graph, returning a ScoreMap.
//
// Both solvers compute x = alpha * A x + beta, where row i of A holds the
// weights of the out-edges of node i.
// =============================================================================

namespace katz::kernel::centrality {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    inline constexpr Real DEFAULT_ALPHA = Real(0.1);
    inline constexpr Real DEFAULT_BETA = Real(1.0);
    inline constexpr Index DEFAULT_MAX_ITER = 1000;
    inline constexpr Real DEFAULT_TOLERANCE = Real(1e-6);
}

// =============================================================================
// SIMD-Accelerated Vector Operations
// =============================================================================

namespace detail {

KATZ_HOT KATZ_FORCE_INLINE Real norm_squared_simd(Array<const Real> x) noexcept {
    namespace s = katz::simd;
    using SimdTag = s::SimdTagFor<Real>;
    const SimdTag d;
    const auto lanes = static_cast<Size>(s::Lanes(d));
    const Size n = x.size();

    auto v_sum0 = s::Zero(d);
    auto v_sum1 = s::Zero(d);

    Size k = 0;
    for (; k + 2 * lanes <= n; k += 2 * lanes) {
        auto v0 = s::LoadU(d, x.data() + k);
        auto v1 = s::LoadU(d, x.data() + k + lanes);
        v_sum0 = s::MulAdd(v0, v0, v_sum0);
        v_sum1 = s::MulAdd(v1, v1, v_sum1);
    }

    Real result = s::GetLane(s::SumOfLanes(d, s::Add(v_sum0, v_sum1)));

    for (; k < n; ++k) {
        result += x[static_cast<Index>(k)] * x[static_cast<Index>(k)];
    }

    return result;
}

KATZ_HOT KATZ_FORCE_INLINE Real l1_diff_simd(
    Array<const Real> a,
    Array<const Real> b
) noexcept {
    namespace s = katz::simd;
    using SimdTag = s::SimdTagFor<Real>;
    const SimdTag d;
    const auto lanes = static_cast<Size>(s::Lanes(d));
    const Size n = a.size();

    auto v_sum = s::Zero(d);

    Size k = 0;
    for (; k + lanes <= n; k += lanes) {
        auto diff = s::Sub(s::LoadU(d, a.data() + k), s::LoadU(d, b.data() + k));
        v_sum = s::Add(v_sum, s::Abs(diff));
    }

    Real result = s::GetLane(s::SumOfLanes(d, v_sum));

    for (; k < n; ++k) {
        result += std::abs(a[static_cast<Index>(k)] - b[static_cast<Index>(k)]);
    }

    return result;
}

KATZ_HOT KATZ_FORCE_INLINE void scale_simd(Array<Real> x, Real factor) noexcept {
    namespace s = katz::simd;
    using SimdTag = s::SimdTagFor<Real>;
    const SimdTag d;
    const auto lanes = static_cast<Size>(s::Lanes(d));
    const Size n = x.size();

    auto v_factor = s::Set(d, factor);

    Size k = 0;
    for (; k + 2 * lanes <= n; k += 2 * lanes) {
        s::StoreU(s::Mul(v_factor, s::LoadU(d, x.data() + k)), d, x.data() + k);
        s::StoreU(s::Mul(v_factor, s::LoadU(d, x.data() + k + lanes)), d, x.data() + k + lanes);
    }

    for (; k < n; ++k) {
        x[static_cast<Index>(k)] *= factor;
    }
}

// y = alpha * A x + beta
KATZ_HOT inline void katz_step(
    const CSRGraph& graph,
    Array<const Real> x,
    Real alpha,
    Array<const Real> beta,
    Array<Real> y
) noexcept {
    const Index n = graph.num_nodes();

    for (Index i = 0; i < n; ++i) {
        auto indices = graph.neighbors(i);
        auto values = graph.weights(i);
        const auto len = static_cast<Index>(indices.size());

        Real sum = Real(0);
        Index k = 0;
        for (; k + 4 <= len; k += 4) {
            sum += values[k + 0] * x[indices[k + 0]];
            sum += values[k + 1] * x[indices[k + 1]];
            sum += values[k + 2] * x[indices[k + 2]];
            sum += values[k + 3] * x[indices[k + 3]];
        }
        for (; k < len; ++k) {
            sum += values[k] * x[indices[k]];
        }

        y[i] = alpha * sum + beta[i];
    }
}

// Unit L2 norm; an all-zero vector is left as is
KATZ_FORCE_INLINE void normalize_l2(Array<Real> scores) noexcept {
    const Real norm_sq = norm_squared_simd(scores);
    if (norm_sq != Real(0)) {
        scale_simd(scores, Real(1) / std::sqrt(norm_sq));
    }
}

inline void require_simple(bool is_multigraph) {
    if (KATZ_UNLIKELY(is_multigraph)) {
        throw UnsupportedGraphError("Katz centrality is not implemented for multigraphs");
    }
}

} // namespace detail

// =============================================================================
// Katz Centrality: Array Kernels
// =============================================================================

/// @brief Power iteration on a CSR graph.
/// @return number of iterations performed
inline Index katz_centrality(
    const CSRGraph& graph,
    Array<Real> centrality,
    Real alpha,
    Array<const Real> beta,
    Index max_iter = config::DEFAULT_MAX_ITER,
    Real tol = config::DEFAULT_TOLERANCE,
    Array<const Real> nstart = {},
    bool normalized = true
) {
    detail::require_simple(graph.is_multigraph());

    const Index n = graph.num_nodes();
    const auto N = static_cast<Size>(n);
    if (n == 0) return 0;

    KATZ_CHECK_DIM(centrality.len >= N, "Katz: output buffer too small");
    KATZ_CHECK_DIM(beta.len == N, "Katz: beta must have one entry per node");
    KATZ_CHECK_DIM(nstart.empty() || nstart.len == N,
                   "Katz: nstart must be empty or have one entry per node");
    KATZ_CHECK_ARG(max_iter >= 0, "Katz: max_iter must be non-negative");

    auto scratch_buf = katz::memory::AlignedBuffer<Real>(N, KATZ_ALIGNMENT);

    Array<Real> prev = scratch_buf.array();
    Array<Real> curr = centrality.first(N);

    if (nstart.empty()) {
        katz::algo::fill(prev.ptr, N, Real(0));
    } else {
        katz::algo::copy(nstart.ptr, prev.ptr, N);
    }

    const Real threshold = static_cast<Real>(n) * tol;
    Real err = Real(0);

    for (Index iter = 0; iter < max_iter; ++iter) {
        detail::katz_step(graph, prev, alpha, beta, curr);

        err = detail::l1_diff_simd(curr, prev);
        if (err < threshold) {
            if (curr.ptr != centrality.ptr) {
                katz::algo::copy(curr.ptr, centrality.ptr, N);
            }
            if (normalized) {
                detail::normalize_l2(centrality.first(N));
            }
            katz::log::logger()->debug(
                "katz_centrality: n={} converged after {} iterations (err={})",
                n, iter + 1, err);
            return iter + 1;
        }

        std::swap(prev, curr);
    }

    katz::log::logger()->warn(
        "katz_centrality: n={} not converged after {} iterations (err={}, threshold={})",
        n, max_iter, err, threshold);
    katz::algo::fill(centrality.ptr, N, Real(0));
    throw ConvergenceError(static_cast<std::int64_t>(max_iter));
}

/// @brief Direct solve of (I - alpha A) x = beta on a CSR graph.
inline void katz_centrality_dense(
    const CSRGraph& graph,
    Array<Real> centrality,
    Real alpha,
    Array<const Real> beta,
    bool normalized = true
) {
    using Matrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic>;
    using Vector = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

    detail::require_simple(graph.is_multigraph());

    const Index n = graph.num_nodes();
    const auto N = static_cast<Size>(n);
    if (n == 0) return;

    KATZ_CHECK_DIM(centrality.len >= N, "Katz: output buffer too small");
    KATZ_CHECK_DIM(beta.len == N, "Katz: beta must have one entry per node");

    Matrix system = Matrix::Identity(n, n);
    for (Index i = 0; i < n; ++i) {
        auto indices = graph.neighbors(i);
        auto values = graph.weights(i);
        for (Index k = 0; k < static_cast<Index>(indices.size()); ++k) {
            system(i, indices[k]) -= alpha * values[k];
        }
    }

    Vector rhs = Eigen::Map<const Vector>(beta.ptr, n);

    Eigen::FullPivLU<Matrix> lu(system);
    if (!lu.isInvertible()) {
        katz::log::logger()->warn(
            "katz_centrality_dense: n={} system is singular (rank {})", n, lu.rank());
        throw SingularMatrixError("Katz: I - alpha * A is singular");
    }

    Vector x = lu.solve(rhs);
    if (!x.allFinite()) {
        katz::log::logger()->warn("katz_centrality_dense: n={} solution is not finite", n);
        throw NumericalError("Katz: linear solve produced non-finite values");
    }

    Real scale = Real(1);
    if (normalized) {
        const Real total = x.sum();
        const Real sign = (total > Real(0)) ? Real(1) : ((total < Real(0)) ? Real(-1) : Real(0));
        const Real signed_norm = sign * x.norm();
        if (signed_norm != Real(0)) {
            scale = Real(1) / signed_norm;
        }
    }

    Eigen::Map<Vector>(centrality.ptr, n) = x * scale;

    katz::log::logger()->debug("katz_centrality_dense: n={} solved", n);
}

// =============================================================================
// Katz Centrality: Node-Keyed Front Ends
// =============================================================================

/// @brief A GraphLike graph compiled into CSR arrays over a fixed node order.
template <GraphLike G>
struct CompactAdjacency {
    using NodeId = NodeIdOf<G>;

    std::vector<NodeId> order;
    std::unordered_map<NodeId, Index> position;
    std::vector<Index> indptr;
    std::vector<Index> indices;
    std::vector<Real> values;

    explicit CompactAdjacency(const G& graph) {
        const auto n = static_cast<Size>(graph.num_nodes());
        order.reserve(n);
        position.reserve(n);
        for (const auto& u : graph.nodes()) {
            position.emplace(u, static_cast<Index>(order.size()));
            order.push_back(u);
        }

        indptr.reserve(n + 1);
        indptr.push_back(0);
        for (const auto& u : order) {
            const auto& nbrs = graph.neighbors(u);
            const auto& ws = graph.weights(u);
            KATZ_CHECK_DIM(std::ranges::size(nbrs) == std::ranges::size(ws),
                           "Katz: neighbors and weights differ in length");

            auto w = std::ranges::begin(ws);
            for (const auto& v : nbrs) {
                auto it = position.find(v);
                if (KATZ_UNLIKELY(it == position.end())) {
                    throw ValueError("Katz: edge points to a node outside nodes()");
                }
                indices.push_back(it->second);
                values.push_back(static_cast<Real>(*w));
                ++w;
            }
            indptr.push_back(static_cast<Index>(indices.size()));
        }
    }

    [[nodiscard]] CSRGraph view() const noexcept {
        return CSRGraph(static_cast<Index>(order.size()),
                        as_array(indptr), as_array(indices), as_array(values));
    }

    [[nodiscard]] ScoreMap<NodeId> zip(const std::vector<Real>& scores) const {
        ScoreMap<NodeId> result;
        result.reserve(order.size());
        for (Size i = 0; i < order.size(); ++i) {
            result.emplace(order[i], scores[i]);
        }
        return result;
    }
};

/// @brief Katz centrality by power iteration.
///
/// @throws UnsupportedGraphError the graph allows parallel edges
/// @throws ConvergenceError      max_iter iterations without convergence
/// @throws MissingBetaEntryError beta does not cover every node
/// @throws MissingEntryError     nstart does not cover every node
template <GraphLike G>
[[nodiscard]] ScoreMap<NodeIdOf<G>> katz_centrality(
    const G& graph,
    Real alpha = config::DEFAULT_ALPHA,
    const Beta<NodeIdOf<G>>& beta = config::DEFAULT_BETA,
    Index max_iter = config::DEFAULT_MAX_ITER,
    Real tol = config::DEFAULT_TOLERANCE,
    const std::optional<ScoreMap<NodeIdOf<G>>>& nstart = std::nullopt,
    bool normalized = true
) {
    detail::require_simple(graph.is_multigraph());

    if (graph.num_nodes() == 0) {
        return {};
    }

    const CompactAdjacency<G> adjacency(graph);
    const std::vector<Real> beta_column = resolve_beta(beta, adjacency.order);

    std::vector<Real> start;
    if (nstart.has_value()) {
        start = resolve_start(*nstart, adjacency.order);
    }

    std::vector<Real> scores(adjacency.order.size());
    katz_centrality(adjacency.view(), as_array(scores), alpha, as_array(beta_column),
                    max_iter, tol, as_array(start), normalized);

    return adjacency.zip(scores);
}

/// @brief Katz centrality by a direct dense linear solve.
///
/// @throws UnsupportedGraphError the graph allows parallel edges
/// @throws SingularMatrixError   I - alpha * A is singular
/// @throws NumericalError        the solve produced non-finite values
/// @throws MissingBetaEntryError beta does not cover every node
template <GraphLike G>
[[nodiscard]] ScoreMap<NodeIdOf<G>> katz_centrality_dense(
    const G& graph,
    Real alpha = config::DEFAULT_ALPHA,
    const Beta<NodeIdOf<G>>& beta = config::DEFAULT_BETA,
    bool normalized = true
) {
    detail::require_simple(graph.is_multigraph());

    if (graph.num_nodes() == 0) {
        return {};
    }

    const CompactAdjacency<G> adjacency(graph);
    const std::vector<Real> beta_column = resolve_beta(beta, adjacency.order);

    std::vector<Real> scores(adjacency.order.size());
    katz_centrality_dense(adjacency.view(), as_array(scores), alpha,
                          as_array(beta_column), normalized);

    return adjacency.zip(scores);
}

} // namespace katz::kernel::centrality
