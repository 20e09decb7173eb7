// =============================================================================
// katz-core - Katz Centrality C API Tests
// =============================================================================
//
// Test coverage for katz/binding/c_api/katz.h
//
// Functions tested:
//   katz_centrality
//   katz_centrality_dense
//
// =============================================================================

#include "test.hpp"

extern "C" {
#include "katz/binding/c_api/katz.h"
}

#include <algorithm>
#include <cmath>
#include <vector>

using namespace katz::test;

static Graph handle_of(const CSRArrays& data, katz_bool_t multigraph = KATZ_FALSE) {
    return make_graph(data.n_nodes, data.nnz(), data.indptr.data(),
                      data.indices.data(), data.data.data(), multigraph);
}

KATZ_TEST_BEGIN

// =============================================================================
// Power Iteration
// =============================================================================

KATZ_TEST_SUITE(c_katz_iterative)

KATZ_TEST_CASE(path_scores) {
    Graph g = handle_of(path_graph(4));
    std::vector<katz_real_t> x(4);
    katz_index_t iters = 0;

    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 1000, 1e-6, nullptr,
                                   KATZ_TRUE, x.data(), 4, &iters), KATZ_OK);

    const double end = 1.0 / 0.89;
    const double mid = (1.0 + 0.1 * end) / 0.9;
    const double norm = std::sqrt(2 * end * end + 2 * mid * mid);

    KATZ_ASSERT_NEAR(x[0], end / norm, 1e-5);
    KATZ_ASSERT_NEAR(x[1], mid / norm, 1e-5);
    KATZ_ASSERT_NEAR(x[2], mid / norm, 1e-5);
    KATZ_ASSERT_NEAR(x[3], end / norm, 1e-5);
    KATZ_ASSERT_GT(iters, katz_index_t(1));
}

KATZ_TEST_CASE(per_node_beta_and_nstart) {
    auto data = cycle_graph(5);
    Graph g = handle_of(data);
    std::vector<katz_real_t> beta = {1.0, 2.0, 3.0, 2.0, 1.0};
    std::vector<katz_real_t> start(5, 0.5);
    std::vector<katz_real_t> x(5);

    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 0.0, beta.data(), 1000, 1e-12, start.data(),
                                   KATZ_FALSE, x.data(), 5, nullptr), KATZ_OK);

    auto expected = oracle::katz_solve(data, 0.1, beta);
    KATZ_ASSERT_TRUE(vectors_close(x, expected, 1e-9, 1e-12));
}

KATZ_TEST_CASE(not_converged) {
    Graph g = handle_of(complete_graph(4));
    std::vector<katz_real_t> x(4);

    katz_error_t err = katz_centrality(g, 0.1, 1.0, nullptr, 2, 1e-6, nullptr,
                                       KATZ_TRUE, x.data(), 4, nullptr);
    KATZ_ASSERT_EQ(err, KATZ_ERROR_CONVERGENCE_ERROR);
    KATZ_ASSERT_EQ(katz_get_last_error_code(), KATZ_ERROR_CONVERGENCE_ERROR);
}

KATZ_TEST_CASE(negative_max_iter) {
    Graph g = handle_of(path_graph(3));
    std::vector<katz_real_t> x(3);

    katz_error_t err = katz_centrality(g, 0.1, 1.0, nullptr, -5, 1e-6, nullptr,
                                       KATZ_TRUE, x.data(), 3, nullptr);
    KATZ_ASSERT_EQ(err, KATZ_ERROR_INVALID_ARGUMENT);
}

KATZ_TEST_CASE(multigraph_unsupported) {
    Graph g = handle_of(path_graph(3), KATZ_TRUE);
    std::vector<katz_real_t> x(3);

    katz_error_t err = katz_centrality(g, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                       KATZ_TRUE, x.data(), 3, nullptr);
    KATZ_ASSERT_EQ(err, KATZ_ERROR_UNSUPPORTED_GRAPH);
}

KATZ_TEST_CASE(empty_graph) {
    Graph g = handle_of(CSRArrays{});
    katz_index_t iters = -1;

    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                   KATZ_TRUE, nullptr, 0, &iters), KATZ_OK);
    KATZ_ASSERT_EQ(iters, katz_index_t(0));
}

KATZ_TEST_SUITE_END

// =============================================================================
// Direct Solve
// =============================================================================

KATZ_TEST_SUITE(c_katz_dense)

KATZ_TEST_CASE(matches_power_iteration) {
    Random rng(31);
    auto data = random_directed_graph(20, 0.25, rng);
    const double alpha = 0.5 / std::max(oracle::spectral_radius(data), 1.0);
    Graph g = handle_of(data);

    std::vector<katz_real_t> direct(20);
    std::vector<katz_real_t> iterative(20);
    KATZ_ASSERT_EQ(katz_centrality_dense(g, alpha, 1.0, nullptr, KATZ_TRUE,
                                         direct.data(), 20), KATZ_OK);
    KATZ_ASSERT_EQ(katz_centrality(g, alpha, 1.0, nullptr, 1000, 1e-12, nullptr,
                                   KATZ_TRUE, iterative.data(), 20, nullptr), KATZ_OK);

    KATZ_ASSERT_LT(max_abs_diff(direct, iterative), 1e-9);
}

KATZ_TEST_CASE(per_node_beta) {
    auto data = star_graph(4);
    Graph g = handle_of(data);
    std::vector<katz_real_t> beta = {0.5, 1.0, 1.5, 2.0};
    std::vector<katz_real_t> x(4);

    KATZ_ASSERT_EQ(katz_centrality_dense(g, 0.2, 0.0, beta.data(), KATZ_FALSE,
                                         x.data(), 4), KATZ_OK);

    auto expected = oracle::katz_solve(data, 0.2, beta);
    KATZ_ASSERT_TRUE(vectors_close(x, expected, 1e-12, 1e-14));
}

KATZ_TEST_CASE(singular_matrix) {
    Graph g = handle_of(path_graph(2));
    std::vector<katz_real_t> x(2);

    katz_error_t err = katz_centrality_dense(g, 1.0, 1.0, nullptr, KATZ_TRUE, x.data(), 2);
    KATZ_ASSERT_EQ(err, KATZ_ERROR_SINGULAR_MATRIX);
}

KATZ_TEST_CASE(multigraph_unsupported) {
    Graph g = handle_of(path_graph(2), KATZ_TRUE);
    std::vector<katz_real_t> x(2);

    katz_error_t err = katz_centrality_dense(g, 0.1, 1.0, nullptr, KATZ_TRUE, x.data(), 2);
    KATZ_ASSERT_EQ(err, KATZ_ERROR_UNSUPPORTED_GRAPH);
}

KATZ_TEST_SUITE_END

// =============================================================================
// Argument Checks
// =============================================================================

KATZ_TEST_SUITE(c_katz_arguments)

KATZ_TEST_CASE(null_graph) {
    std::vector<katz_real_t> x(3);
    KATZ_ASSERT_EQ(katz_centrality(nullptr, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                   KATZ_TRUE, x.data(), 3, nullptr), KATZ_ERROR_NULL_POINTER);
    KATZ_ASSERT_EQ(katz_centrality_dense(nullptr, 0.1, 1.0, nullptr, KATZ_TRUE,
                                         x.data(), 3), KATZ_ERROR_NULL_POINTER);
}

KATZ_TEST_CASE(null_output) {
    Graph g = handle_of(path_graph(3));
    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                   KATZ_TRUE, nullptr, 3, nullptr), KATZ_ERROR_NULL_POINTER);
    KATZ_ASSERT_EQ(katz_centrality_dense(g, 0.1, 1.0, nullptr, KATZ_TRUE,
                                         nullptr, 3), KATZ_ERROR_NULL_POINTER);
}

KATZ_TEST_CASE(multigraph_reported_before_length) {
    Graph g = handle_of(path_graph(3), KATZ_TRUE);
    std::vector<katz_real_t> x(5);

    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                   KATZ_TRUE, x.data(), 5, nullptr),
                   KATZ_ERROR_UNSUPPORTED_GRAPH);
    KATZ_ASSERT_EQ(katz_centrality_dense(g, 0.1, 1.0, nullptr, KATZ_TRUE, x.data(), 5),
                   KATZ_ERROR_UNSUPPORTED_GRAPH);
}

KATZ_TEST_CASE(not_converged_output_zeroed) {
    Graph g = handle_of(path_graph(3));
    std::vector<katz_real_t> x(3, 9.0);

    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 1, 1e-6, nullptr,
                                   KATZ_TRUE, x.data(), 3, nullptr),
                   KATZ_ERROR_CONVERGENCE_ERROR);
    KATZ_ASSERT_TRUE(std::all_of(x.begin(), x.end(),
                                 [](katz_real_t v) { return v == 0.0; }));
}

KATZ_TEST_CASE(length_mismatch) {
    Graph g = handle_of(path_graph(3));
    std::vector<katz_real_t> x(4);
    KATZ_ASSERT_EQ(katz_centrality(g, 0.1, 1.0, nullptr, 100, 1e-6, nullptr,
                                   KATZ_TRUE, x.data(), 4, nullptr),
                   KATZ_ERROR_DIMENSION_MISMATCH);
    KATZ_ASSERT_EQ(katz_centrality_dense(g, 0.1, 1.0, nullptr, KATZ_TRUE, x.data(), 2),
                   KATZ_ERROR_DIMENSION_MISMATCH);
}

KATZ_TEST_SUITE_END

KATZ_TEST_END

KATZ_TEST_MAIN()
