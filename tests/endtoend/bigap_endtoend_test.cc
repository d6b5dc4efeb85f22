#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "bigap/bigap.h"
#include "bigap/datastructures/graph.h"
#include "bigap/metrics.h"

#include "bigap-common/errors.h"

#include "tests/graph_factories.h"
#include "tests/test_helpers.h"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace bigap::testing {
TEST(BiGapEndToEndTest, ReordersCopiedGraph) {
  // 0 -> {1, 2}, 1 -> {0}, 2 -> {3}, 3 -> {2}
  const std::vector<EdgeID> xadj = {0, 2, 3, 4, 5};
  const std::vector<NodeID> adjncy = {1, 2, 0, 3, 2};

  BiGap reorderer(1, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);
  reorderer.copy_graph(xadj, adjncy);
  ASSERT_NE(reorderer.graph(), nullptr);
  EXPECT_EQ(reorderer.graph()->n(), 4);

  std::vector<NodeID> permutation(4);
  const double cost = reorderer.compute_permutation(permutation);
  EXPECT_THAT(permutation, ElementsAre(0, 1, 2, 3));
  EXPECT_DOUBLE_EQ(cost, metrics::log_gap_cost(*reorderer.graph()));
}

TEST(BiGapEndToEndTest, ReducesLogGapCost) {
  BiGap reorderer(4, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);
  reorderer.set_graph(make_scattered_clique_graph(256, 16));
  const double cost_before = metrics::log_gap_cost(*reorderer.graph());

  std::vector<NodeID> permutation(256);
  const double cost_after = reorderer.compute_permutation(permutation);

  EXPECT_TRUE(is_bijection(permutation));
  EXPECT_LT(cost_after, cost_before);
  EXPECT_DOUBLE_EQ(cost_after, metrics::log_gap_cost(*reorderer.graph(), permutation));
}

TEST(BiGapEndToEndTest, ResultIsIndependentOfNumberOfThreads) {
  BiGap seq(1, create_default_context());
  seq.set_output_level(OutputLevel::QUIET);
  seq.set_graph(make_pseudo_random_graph(5000, 10));
  const std::vector<NodeID> seq_permutation = seq.compute_permutation();

  BiGap par(4, create_default_context());
  par.set_output_level(OutputLevel::QUIET);
  par.context().parallel.min_parallel_size = 64;
  par.set_graph(make_pseudo_random_graph(5000, 10));
  const std::vector<NodeID> par_permutation = par.compute_permutation();

  EXPECT_EQ(seq_permutation, par_permutation);
}

TEST(BiGapEndToEndTest, ValidatesPermutationOnRequest) {
  BiGap reorderer(1, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);
  reorderer.context().debug.validate_permutation = true;
  reorderer.set_graph(make_pseudo_random_graph(300, 5));

  EXPECT_TRUE(is_bijection(reorderer.compute_permutation()));
}

TEST(BiGapEndToEndTest, EmptyGraph) {
  BiGap reorderer(1, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);
  reorderer.copy_graph({}, {});
  ASSERT_NE(reorderer.graph(), nullptr);
  EXPECT_EQ(reorderer.graph()->n(), 0);

  EXPECT_THAT(reorderer.compute_permutation(), IsEmpty());
}

TEST(BiGapEndToEndTest, GraphCanBeTakenBack) {
  BiGap reorderer(1, create_default_context());
  reorderer.set_graph(make_path_graph(5));

  const Graph graph = reorderer.take_graph();
  EXPECT_EQ(graph.n(), 5);
  EXPECT_EQ(reorderer.graph(), nullptr);
  EXPECT_THROW((void)reorderer.take_graph(), std::invalid_argument);
}

TEST(BiGapEndToEndTest, RejectsMissingGraph) {
  BiGap reorderer(1, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);

  std::vector<NodeID> permutation;
  EXPECT_THROW(reorderer.compute_permutation(permutation), std::invalid_argument);
  EXPECT_THROW((void)reorderer.compute_permutation(), std::invalid_argument);
}

TEST(BiGapEndToEndTest, RejectsSpanOfWrongSize) {
  BiGap reorderer(1, create_default_context());
  reorderer.set_output_level(OutputLevel::QUIET);
  reorderer.set_graph(make_path_graph(5));

  std::vector<NodeID> permutation(4);
  EXPECT_THROW(reorderer.compute_permutation(permutation), std::invalid_argument);
}

TEST(BiGapEndToEndTest, RejectsMalformedGraph) {
  BiGap reorderer(1, create_default_context());

  const std::vector<EdgeID> xadj = {0, 1, 2};
  const std::vector<NodeID> out_of_range = {1, 2};
  EXPECT_THROW(reorderer.copy_graph(xadj, out_of_range), LoadError);

  const std::vector<EdgeID> bad_offsets = {0, 1, 3};
  const std::vector<NodeID> adjncy = {0, 1};
  EXPECT_THROW(reorderer.copy_graph(bad_offsets, adjncy), LoadError);
}

TEST(BiGapEndToEndTest, AllPresetsProduceBijections) {
  for (const std::string &preset : get_preset_names()) {
    BiGap reorderer(2, create_context_by_preset_name(preset));
    reorderer.set_output_level(OutputLevel::QUIET);
    reorderer.set_graph(make_clique_clusters_graph(16, 12));

    EXPECT_TRUE(is_bijection(reorderer.compute_permutation())) << preset;
  }
}
} // namespace bigap::testing
