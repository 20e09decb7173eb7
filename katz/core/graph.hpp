#pragma once

#include "katz/core/type.hpp"
#include "katz/core/error.hpp"
#include "katz/core/macros.hpp"

#include <algorithm>
#include <concepts>
#include <functional>
#include <ranges>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
/// @file graph.hpp
/// @brief katz Graph Views and Containers
///
/// The centrality kernels never own or mutate a graph. They consume any type
/// modelling `GraphLike`:
///
/// - `NodeId`          hashable node identity
/// - `num_nodes()`     node count
/// - `nodes()`         every node once, in a fixed order
/// - `neighbors(u)`    out-neighbors of u
/// - `weights(u)`      edge weights, parallel to neighbors(u)
/// - `is_multigraph()` true if parallel edges are permitted
///
/// @section Storage
/// - CSRGraph: non-owning Compressed Sparse Row view, NodeId = Index.
///   - Row `i` corresponds to Node `i`.
///   - Column indices in Row `i` are the neighbors of Node `i`.
///   - Values in Row `i` are the edge weights.
/// - AdjacencyGraph<NodeId>: owning adjacency lists keyed by arbitrary ids.
///
// =============================================================================

namespace katz {

// =============================================================================
// SECTION 1: Graph Concept
// =============================================================================

template <typename G>
concept GraphLike = requires(const G& g, const typename G::NodeId& u) {
    typename G::NodeId;
    { g.num_nodes() } -> std::convertible_to<Index>;
    { g.is_multigraph() } -> std::convertible_to<bool>;
    { g.nodes() } -> std::ranges::forward_range;
    { g.neighbors(u) } -> std::ranges::sized_range;
    { g.weights(u) } -> std::ranges::sized_range;
    { std::hash<typename G::NodeId>{}(u) } -> std::convertible_to<std::size_t>;
};

template <GraphLike G>
using NodeIdOf = typename G::NodeId;

// =============================================================================
// SECTION 2: CSR Graph View
// =============================================================================

/// @brief Lightweight view of a weighted graph stored as CSR arrays.
///
/// Owns nothing; the arrays must outlive the view. Every edge carries an
/// explicit weight (callers with unweighted data pass a vector of ones).
struct CSRGraph {
    using NodeId = Index;

    Index n_nodes = 0;
    Array<const Index> indptr;    // [n_nodes + 1]
    Array<const Index> indices;   // [nnz]
    Array<const Real> values;     // [nnz]
    bool multigraph = false;

    constexpr CSRGraph() noexcept = default;

    constexpr CSRGraph(Index n, Array<const Index> offsets, Array<const Index> cols,
                       Array<const Real> data, bool allows_parallel = false) noexcept
        : n_nodes(n), indptr(offsets), indices(cols), values(data),
          multigraph(allows_parallel) {}

    [[nodiscard]] KATZ_FORCE_INLINE Index num_nodes() const noexcept { return n_nodes; }

    [[nodiscard]] KATZ_FORCE_INLINE Index num_edges() const noexcept {
        return n_nodes == 0 ? Index(0) : indptr[n_nodes];
    }

    [[nodiscard]] KATZ_FORCE_INLINE bool is_multigraph() const noexcept { return multigraph; }

    [[nodiscard]] auto nodes() const noexcept {
        return std::views::iota(Index(0), n_nodes);
    }

    /// @brief Out-degree of a node.
    [[nodiscard]] KATZ_FORCE_INLINE Index degree(Index u) const noexcept {
        return indptr[u + 1] - indptr[u];
    }

    [[nodiscard]] KATZ_FORCE_INLINE Array<const Index> neighbors(Index u) const noexcept {
        return indices.subspan(indptr[u], static_cast<Size>(degree(u)));
    }

    [[nodiscard]] KATZ_FORCE_INLINE Array<const Real> weights(Index u) const noexcept {
        return values.subspan(indptr[u], static_cast<Size>(degree(u)));
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return n_nodes == 0; }

    /// @brief Structural validation of the CSR arrays.
    /// @throws DimensionError        array lengths disagree
    /// @throws ValueError            offsets are not non-decreasing
    /// @throws IndexOutOfBoundsError a column index is outside [0, n_nodes)
    void validate() const {
        KATZ_CHECK_ARG(n_nodes >= 0, "CSRGraph: negative node count");
        if (n_nodes == 0) return;

        KATZ_CHECK_DIM(indptr.size() == static_cast<Size>(n_nodes) + 1,
                       "CSRGraph: indptr must have n_nodes + 1 entries");
        KATZ_CHECK_ARG(indptr[0] == 0, "CSRGraph: indptr[0] must be 0");

        for (Index i = 0; i < n_nodes; ++i) {
            KATZ_CHECK_ARG(indptr[i] <= indptr[i + 1],
                           "CSRGraph: indptr must be non-decreasing");
        }

        const auto nnz = static_cast<Size>(indptr[n_nodes]);
        KATZ_CHECK_DIM(indices.size() == nnz, "CSRGraph: indices length != nnz");
        KATZ_CHECK_DIM(values.size() == nnz, "CSRGraph: values length != nnz");

        for (Size k = 0; k < nnz; ++k) {
            KATZ_CHECK_BOUNDS(indices[static_cast<Index>(k)], static_cast<Size>(n_nodes),
                              "CSRGraph: column index out of range");
        }
    }
};

/// @brief True if some row lists the same column more than once.
[[nodiscard]] inline bool has_parallel_edges(const CSRGraph& g) {
    std::vector<Index> row;
    for (Index u = 0; u < g.n_nodes; ++u) {
        auto nbrs = g.neighbors(u);
        if (nbrs.size() < 2) continue;
        row.assign(nbrs.begin(), nbrs.end());
        std::sort(row.begin(), row.end());
        if (std::adjacent_find(row.begin(), row.end()) != row.end()) {
            return true;
        }
    }
    return false;
}

static_assert(GraphLike<CSRGraph>);

// =============================================================================
// SECTION 3: Adjacency-List Graph
// =============================================================================

/// @brief Owning weighted graph keyed by arbitrary hashable node ids.
///
/// Nodes keep insertion order. Undirected edges are stored as two arcs
/// (a self-loop as one). On a simple graph, adding an existing edge
/// replaces its weight; on a multigraph it adds a parallel edge.
template <typename Node, typename Hash = std::hash<Node>>
class AdjacencyGraph {
public:
    using NodeId = Node;

    explicit AdjacencyGraph(bool directed = false, bool multigraph = false)
        : directed_(directed), multigraph_(multigraph) {}

    /// @brief Add a node if absent. Returns its position in nodes().
    Index add_node(const NodeId& u) {
        auto it = index_.find(u);
        if (it != index_.end()) {
            return it->second;
        }
        const auto idx = static_cast<Index>(nodes_.size());
        index_.emplace(u, idx);
        nodes_.push_back(u);
        targets_.emplace_back();
        weights_.emplace_back();
        return idx;
    }

    void add_edge(const NodeId& u, const NodeId& v, Real weight = Real(1)) {
        const Index iu = add_node(u);
        const Index iv = add_node(v);

        bool added = insert_arc(iu, v, weight);
        if (!directed_ && iu != iv) {
            insert_arc(iv, u, weight);
        }
        if (added) {
            ++n_edges_;
        }
    }

    [[nodiscard]] Index num_nodes() const noexcept { return static_cast<Index>(nodes_.size()); }
    [[nodiscard]] Index num_edges() const noexcept { return n_edges_; }
    [[nodiscard]] bool is_directed() const noexcept { return directed_; }
    [[nodiscard]] bool is_multigraph() const noexcept { return multigraph_; }

    [[nodiscard]] bool contains(const NodeId& u) const { return index_.find(u) != index_.end(); }

    [[nodiscard]] const std::vector<NodeId>& nodes() const noexcept { return nodes_; }

    [[nodiscard]] const std::vector<NodeId>& neighbors(const NodeId& u) const {
        return targets_[static_cast<Size>(position(u))];
    }

    [[nodiscard]] const std::vector<Real>& weights(const NodeId& u) const {
        return weights_[static_cast<Size>(position(u))];
    }

    /// @brief Position of a node in nodes().
    /// @throws ValueError if the node is not in the graph
    [[nodiscard]] Index position(const NodeId& u) const {
        auto it = index_.find(u);
        if (KATZ_UNLIKELY(it == index_.end())) {
            throw ValueError("AdjacencyGraph: node is not in the graph");
        }
        return it->second;
    }

private:
    bool insert_arc(Index from, const NodeId& to, Real weight) {
        auto& targets = targets_[static_cast<Size>(from)];
        auto& weights = weights_[static_cast<Size>(from)];

        if (!multigraph_) {
            auto it = std::find(targets.begin(), targets.end(), to);
            if (it != targets.end()) {
                weights[static_cast<Size>(it - targets.begin())] = weight;
                return false;
            }
        }
        targets.push_back(to);
        weights.push_back(weight);
        return true;
    }

    bool directed_;
    bool multigraph_;
    Index n_edges_ = 0;
    std::vector<NodeId> nodes_;
    std::unordered_map<NodeId, Index, Hash> index_;
    std::vector<std::vector<NodeId>> targets_;
    std::vector<std::vector<Real>> weights_;
};

static_assert(GraphLike<AdjacencyGraph<std::string>>);
static_assert(GraphLike<AdjacencyGraph<Index>>);

} // namespace katz
