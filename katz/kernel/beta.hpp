#pragma once

#include "katz/core/type.hpp"
#include "katz/core/error.hpp"

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// =============================================================================
// FILE: katz/kernel/beta.hpp
// BRIEF: Per-node bias (beta) and start-vector resolution
//
// Beta arrives in one of three shapes and is resolved once, before any
// numeric work, into a dense column aligned with a fixed node order:
//
//   Real                          broadcast to every node
//   std::vector<Real>             positional, aligned with the node order
//   std::unordered_map<NodeId,R>  explicit per-node values
// =============================================================================

namespace katz::kernel::centrality {

template <typename NodeId>
using ScoreMap = std::unordered_map<NodeId, Real>;

template <typename NodeId>
using Beta = std::variant<Real, std::vector<Real>, ScoreMap<NodeId>>;

/// @brief Resolve beta into one value per node of `order`.
///
/// @throws MissingBetaEntryError a sequence is too short, or a mapping lacks a node
/// @throws DimensionError        a sequence is longer than the node count
///
/// Keys of a mapping that are not in `order` are ignored.
template <typename NodeId>
[[nodiscard]] std::vector<Real> resolve_beta(
    const Beta<NodeId>& beta,
    const std::vector<NodeId>& order
) {
    const Size n = order.size();
    std::vector<Real> column(n);

    if (const auto* scalar = std::get_if<Real>(&beta)) {
        column.assign(n, *scalar);
        return column;
    }

    if (const auto* sequence = std::get_if<std::vector<Real>>(&beta)) {
        if (sequence->size() < n) {
            throw MissingBetaEntryError(
                "beta: sequence has " + std::to_string(sequence->size()) +
                " entries for " + std::to_string(n) + " nodes");
        }
        KATZ_CHECK_DIM(sequence->size() == n,
                       "beta: sequence is longer than the node count");
        column.assign(sequence->begin(), sequence->end());
        return column;
    }

    const auto& mapping = std::get<ScoreMap<NodeId>>(beta);
    for (Size i = 0; i < n; ++i) {
        auto it = mapping.find(order[i]);
        if (KATZ_UNLIKELY(it == mapping.end())) {
            throw MissingBetaEntryError(
                "beta: no entry for node at position " + std::to_string(i));
        }
        column[i] = it->second;
    }
    return column;
}

/// @brief Resolve a caller-supplied start vector into one value per node.
/// @throws MissingEntryError if a node has no starting value
template <typename NodeId>
[[nodiscard]] std::vector<Real> resolve_start(
    const ScoreMap<NodeId>& nstart,
    const std::vector<NodeId>& order
) {
    std::vector<Real> column(order.size());
    for (Size i = 0; i < order.size(); ++i) {
        auto it = nstart.find(order[i]);
        if (KATZ_UNLIKELY(it == nstart.end())) {
            throw MissingEntryError(
                "nstart: no entry for node at position " + std::to_string(i));
        }
        column[i] = it->second;
    }
    return column;
}

} // namespace katz::kernel::centrality
