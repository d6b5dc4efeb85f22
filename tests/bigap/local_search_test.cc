#include <numeric>
#include <vector>

#include <gmock/gmock.h>

#include "bigap/bisection/gain_table.h"
#include "bigap/bisection/local_search.h"
#include "bigap/gains/gain_models.h"

#include "tests/graph_factories.h"
#include "tests/test_helpers.h"

using ::testing::ElementsAreArray;

namespace bigap::testing {
namespace {
std::vector<NodeID> identity(const NodeID n) {
  std::vector<NodeID> nodes(n);
  std::iota(nodes.begin(), nodes.end(), 0);
  return nodes;
}

// Two cliques {0, ..., 7} and {8, ..., 15}; the initial split mixes them up
std::vector<NodeID> mixed_cluster_order() {
  return {0, 1, 2, 3, 4, 5, 8, 9, 6, 7, 10, 11, 12, 13, 14, 15};
}
} // namespace

TEST(LocalSearchTest, GoodBisectionConvergesImmediately) {
  const Graph graph = make_graph({{1, 2}, {0}, {3}, {2}});
  const auto nodes = identity(4);
  GainTable table(graph, nodes, 2, false);

  const BisectionContext b_ctx = create_default_context().bisection;
  const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
  const LocalSearchResult result = optimizer.optimize(table);

  EXPECT_EQ(result.num_rounds, 1);
  EXPECT_EQ(result.num_swaps, 0);
  EXPECT_TRUE(result.converged);
}

TEST(LocalSearchTest, SeparatesTwoCliques) {
  const Graph graph = make_clique_clusters_graph(2, 8);
  auto nodes = mixed_cluster_order();
  GainTable table(graph, nodes, 8, false);

  const BisectionContext b_ctx = create_default_context().bisection;
  const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
  const LocalSearchResult result = optimizer.optimize(table);

  EXPECT_EQ(result.num_rounds, 2);
  EXPECT_EQ(result.num_swaps, 2);
  EXPECT_TRUE(result.converged);

  for (NodeID i = 0; i < table.n(); ++i) {
    EXPECT_EQ(table.side(i), table.node(i) < 8 ? GainTable::kLeft : GainTable::kRight)
        << "node " << table.node(i);
  }

  table.write_back(nodes);
  EXPECT_THAT(nodes, ElementsAreArray(identity(16)));
}

TEST(LocalSearchTest, OptimizedBisectionIsStable) {
  const Graph graph = make_clique_clusters_graph(2, 8);
  const auto nodes = identity(16);
  GainTable table(graph, nodes, 8, false);

  const BisectionContext b_ctx = create_default_context().bisection;
  const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
  const LocalSearchResult result = optimizer.optimize(table);

  EXPECT_EQ(result.num_rounds, 1);
  EXPECT_EQ(result.num_swaps, 0);
  EXPECT_TRUE(result.converged);
}

TEST(LocalSearchTest, StopsAfterMaximumNumberOfRounds) {
  const Graph graph = make_clique_clusters_graph(2, 8);
  const auto nodes = mixed_cluster_order();
  GainTable table(graph, nodes, 8, false);

  BisectionContext b_ctx = create_default_context().bisection;
  b_ctx.num_iterations = 1;
  const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
  const LocalSearchResult result = optimizer.optimize(table);

  EXPECT_EQ(result.num_rounds, 1);
  EXPECT_EQ(result.num_swaps, 2);
  EXPECT_FALSE(result.converged);
}

TEST(LocalSearchTest, ZeroRoundsLeaveTheSplitUntouched) {
  const Graph graph = make_clique_clusters_graph(2, 8);
  const auto nodes = mixed_cluster_order();
  GainTable table(graph, nodes, 8, false);

  BisectionContext b_ctx = create_default_context().bisection;
  b_ctx.num_iterations = 0;
  const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
  const LocalSearchResult result = optimizer.optimize(table);

  EXPECT_EQ(result.num_rounds, 0);
  EXPECT_EQ(result.num_swaps, 0);
  EXPECT_FALSE(result.converged);
  for (NodeID i = 0; i < table.n(); ++i) {
    EXPECT_EQ(table.side(i), i < 8 ? GainTable::kLeft : GainTable::kRight);
  }
}

TEST(LocalSearchTest, KeepsBalanceAndNeverIncreasesCost) {
  const Graph graph = make_pseudo_random_graph(101, 10);
  const auto nodes = identity(101);

  for (const bool parallel : {false, true}) {
    GainTable table(graph, nodes, 51, parallel);

    const DefaultCostModel model(51, 50);
    table.compute_costs(model);
    const double initial_cost = table.total_cost();

    const BisectionContext b_ctx = create_default_context().bisection;
    const LocalSearchOptimizer<DefaultCostModel> optimizer(b_ctx);
    optimizer.optimize(table);

    EXPECT_EQ(table.count(GainTable::kLeft), 51);
    EXPECT_EQ(table.count(GainTable::kRight), 50);
    EXPECT_LE(table.total_cost(), initial_cost + 1e-3);
  }
}

TEST(LocalSearchTest, ParallelAndSequentialSearchAgree) {
  const Graph graph = make_pseudo_random_graph(300, 10);
  const auto nodes = identity(300);

  GainTable seq_table(graph, nodes, 150, false);
  GainTable par_table(graph, nodes, 150, true);

  const BisectionContext b_ctx = create_default_context().bisection;
  const LocalSearchOptimizer<Approx1CostModel> optimizer(b_ctx);
  const LocalSearchResult seq_result = optimizer.optimize(seq_table);
  const LocalSearchResult par_result = optimizer.optimize(par_table);

  EXPECT_EQ(seq_result.num_rounds, par_result.num_rounds);
  EXPECT_EQ(seq_result.num_swaps, par_result.num_swaps);
  for (NodeID i = 0; i < seq_table.n(); ++i) {
    EXPECT_EQ(seq_table.side(i), par_table.side(i));
  }
}
} // namespace bigap::testing
