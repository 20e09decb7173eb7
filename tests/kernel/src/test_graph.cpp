// =============================================================================
// katz-core - Graph View and Container Tests
// =============================================================================
//
// Test coverage for katz/core/graph.hpp
//
//   - CSRGraph accessors and validate()
//   - has_parallel_edges
//   - AdjacencyGraph insertion rules (directed, undirected, multigraph)
//
// =============================================================================

#include "test.hpp"

#include "katz/core/graph.hpp"

#include <string>
#include <vector>

using namespace katz::test;

using katz::AdjacencyGraph;
using katz::CSRGraph;
using katz::Index;
using katz::Real;

static CSRGraph view(const CSRArrays& g, bool multigraph = false) {
    return CSRGraph(g.n_nodes, katz::as_array(g.indptr), katz::as_array(g.indices),
                    katz::as_array(g.data), multigraph);
}

KATZ_TEST_BEGIN

// =============================================================================
// CSR View
// =============================================================================

KATZ_TEST_SUITE(csr_view)

KATZ_TEST_CASE(path_accessors) {
    auto g = path_graph(4);
    CSRGraph csr = view(g);

    KATZ_ASSERT_EQ(csr.num_nodes(), Index(4));
    KATZ_ASSERT_EQ(csr.num_edges(), Index(6));
    KATZ_ASSERT_FALSE(csr.is_multigraph());
    KATZ_ASSERT_FALSE(csr.empty());

    KATZ_ASSERT_EQ(csr.degree(0), Index(1));
    KATZ_ASSERT_EQ(csr.degree(1), Index(2));

    auto nbrs = csr.neighbors(2);
    KATZ_ASSERT_EQ(nbrs.size(), std::size_t(2));
    KATZ_ASSERT_EQ(nbrs[0], Index(1));
    KATZ_ASSERT_EQ(nbrs[1], Index(3));

    auto ws = csr.weights(2);
    KATZ_ASSERT_EQ(ws.size(), std::size_t(2));
    KATZ_ASSERT_NEAR(ws[0], 1.0, 0.0);
}

KATZ_TEST_CASE(nodes_are_iota) {
    auto g = star_graph(5);
    CSRGraph csr = view(g);

    Index expected = 0;
    for (Index u : csr.nodes()) {
        KATZ_ASSERT_EQ(u, expected);
        ++expected;
    }
    KATZ_ASSERT_EQ(expected, Index(5));
}

KATZ_TEST_CASE(default_view_is_empty) {
    CSRGraph csr;
    KATZ_ASSERT_TRUE(csr.empty());
    KATZ_ASSERT_EQ(csr.num_edges(), Index(0));
    KATZ_ASSERT_NO_THROW(csr.validate());
}

KATZ_TEST_CASE(validate_accepts_well_formed) {
    auto g = complete_graph(6);
    KATZ_ASSERT_NO_THROW(view(g).validate());
}

KATZ_TEST_SUITE_END

// =============================================================================
// Validation Failures
// =============================================================================

KATZ_TEST_SUITE(csr_validate)

KATZ_TEST_CASE(short_indptr_is_dimension_error) {
    auto g = path_graph(3);
    g.indptr.pop_back();
    KATZ_ASSERT_THROWS(view(g).validate(), katz::DimensionError);
}

KATZ_TEST_CASE(nonzero_first_offset_rejected) {
    auto g = path_graph(3);
    g.indptr[0] = 1;
    KATZ_ASSERT_THROWS(view(g).validate(), katz::ValueError);
}

KATZ_TEST_CASE(decreasing_offsets_rejected) {
    auto g = path_graph(4);
    // 0 1 3 5 6 -> 0 4 3 5 6
    g.indptr[1] = 4;
    KATZ_ASSERT_THROWS(view(g).validate(), katz::ValueError);
}

KATZ_TEST_CASE(weights_length_mismatch) {
    auto g = path_graph(3);
    g.data.pop_back();
    KATZ_ASSERT_THROWS(view(g).validate(), katz::DimensionError);
}

KATZ_TEST_CASE(column_out_of_range) {
    auto g = path_graph(3);
    g.indices[0] = 3;
    KATZ_ASSERT_THROWS(view(g).validate(), katz::IndexOutOfBoundsError);
}

KATZ_TEST_CASE(negative_column_rejected) {
    auto g = path_graph(3);
    g.indices[1] = -1;
    KATZ_ASSERT_THROWS(view(g).validate(), katz::IndexOutOfBoundsError);
}

KATZ_TEST_SUITE_END

// =============================================================================
// Parallel Edge Detection
// =============================================================================

KATZ_TEST_SUITE(parallel_edges)

KATZ_TEST_CASE(simple_graphs_have_none) {
    KATZ_ASSERT_FALSE(katz::has_parallel_edges(view(path_graph(5))));
    KATZ_ASSERT_FALSE(katz::has_parallel_edges(view(complete_graph(4))));
    KATZ_ASSERT_FALSE(katz::has_parallel_edges(view(empty_edges_graph(3))));
}

KATZ_TEST_CASE(repeated_column_detected) {
    CSRArrays g;
    g.n_nodes = 2;
    g.indptr = {0, 3, 3};
    g.indices = {1, 0, 1};
    g.data = {1.0, 1.0, 2.0};

    KATZ_ASSERT_TRUE(katz::has_parallel_edges(view(g)));
}

KATZ_TEST_SUITE_END

// =============================================================================
// Adjacency Graph
// =============================================================================

KATZ_TEST_SUITE(adjacency_graph)

KATZ_TEST_CASE(undirected_edge_stored_both_ways) {
    AdjacencyGraph<std::string> g;
    g.add_edge("a", "b", 2.5);

    KATZ_ASSERT_EQ(g.num_nodes(), Index(2));
    KATZ_ASSERT_EQ(g.num_edges(), Index(1));
    KATZ_ASSERT_FALSE(g.is_directed());

    KATZ_ASSERT_EQ(g.neighbors("a").size(), std::size_t(1));
    KATZ_ASSERT_EQ(g.neighbors("a")[0], std::string("b"));
    KATZ_ASSERT_EQ(g.neighbors("b")[0], std::string("a"));
    KATZ_ASSERT_NEAR(g.weights("b")[0], 2.5, 0.0);
}

KATZ_TEST_CASE(directed_edge_stored_once) {
    AdjacencyGraph<std::string> g(true);
    g.add_edge("a", "b");

    KATZ_ASSERT_TRUE(g.is_directed());
    KATZ_ASSERT_EQ(g.neighbors("a").size(), std::size_t(1));
    KATZ_ASSERT_TRUE(g.neighbors("b").empty());
    KATZ_ASSERT_NEAR(g.weights("a")[0], 1.0, 0.0);
}

KATZ_TEST_CASE(self_loop_stored_once) {
    AdjacencyGraph<Index> g;
    g.add_edge(7, 7, 0.5);

    KATZ_ASSERT_EQ(g.num_nodes(), Index(1));
    KATZ_ASSERT_EQ(g.neighbors(7).size(), std::size_t(1));
    KATZ_ASSERT_EQ(g.num_edges(), Index(1));
}

KATZ_TEST_CASE(simple_graph_replaces_weight) {
    AdjacencyGraph<std::string> g;
    g.add_edge("a", "b", 1.0);
    g.add_edge("b", "a", 3.0);

    KATZ_ASSERT_EQ(g.num_edges(), Index(1));
    KATZ_ASSERT_EQ(g.neighbors("a").size(), std::size_t(1));
    KATZ_ASSERT_NEAR(g.weights("a")[0], 3.0, 0.0);
    KATZ_ASSERT_NEAR(g.weights("b")[0], 3.0, 0.0);
}

KATZ_TEST_CASE(multigraph_keeps_parallel_edges) {
    AdjacencyGraph<std::string> g(false, true);
    g.add_edge("a", "b");
    g.add_edge("a", "b");

    KATZ_ASSERT_TRUE(g.is_multigraph());
    KATZ_ASSERT_EQ(g.num_edges(), Index(2));
    KATZ_ASSERT_EQ(g.neighbors("a").size(), std::size_t(2));
}

KATZ_TEST_CASE(nodes_keep_insertion_order) {
    AdjacencyGraph<std::string> g;
    g.add_node("z");
    g.add_edge("m", "a");
    KATZ_ASSERT_EQ(g.add_node("z"), Index(0));

    const auto& order = g.nodes();
    KATZ_ASSERT_EQ(order.size(), std::size_t(3));
    KATZ_ASSERT_EQ(order[0], std::string("z"));
    KATZ_ASSERT_EQ(order[1], std::string("m"));
    KATZ_ASSERT_EQ(order[2], std::string("a"));
    KATZ_ASSERT_EQ(g.position("a"), Index(2));
}

KATZ_TEST_CASE(unknown_node_lookup_fails) {
    AdjacencyGraph<std::string> g;
    g.add_node("a");

    KATZ_ASSERT_FALSE(g.contains("b"));
    KATZ_ASSERT_THROWS(static_cast<void>(g.position("b")), katz::ValueError);
    KATZ_ASSERT_THROWS(static_cast<void>(g.neighbors("b")), katz::ValueError);
}

KATZ_TEST_SUITE_END

KATZ_TEST_END

KATZ_TEST_MAIN()
