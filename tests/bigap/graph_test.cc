#include <gmock/gmock.h>

#include "bigap/datastructures/graph.h"

#include "bigap-common/errors.h"

#include "tests/graph_factories.h"
#include "tests/test_helpers.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace bigap::testing {
namespace {
Graph make_raw_graph(std::initializer_list<EdgeID> nodes, std::initializer_list<NodeID> edges) {
  return Graph(static_array::create<EdgeID>(nodes), static_array::create<NodeID>(edges));
}

template <typename Lambda> std::string validation_error(Lambda &&l) {
  try {
    l();
  } catch (const LoadError &e) {
    return e.what();
  }
  return "";
}
} // namespace

TEST(GraphTest, DefaultConstructedGraphIsEmpty) {
  Graph graph;
  EXPECT_EQ(graph.n(), 0);
  EXPECT_EQ(graph.m(), 0);
  EXPECT_EQ(graph.max_degree(), 0);
  EXPECT_NO_THROW(graph.validate());
}

TEST(GraphTest, EmptyNodeArrayIsTreatedAsEmptyGraph) {
  Graph graph(StaticArray<EdgeID>{}, StaticArray<NodeID>{});
  EXPECT_EQ(graph.n(), 0);
  EXPECT_NO_THROW(graph.validate());
}

TEST(GraphTest, ExposesOutNeighbors) {
  const Graph graph = make_graph({{1, 2}, {0}, {3}, {2}});

  EXPECT_EQ(graph.n(), 4);
  EXPECT_EQ(graph.m(), 5);
  EXPECT_EQ(graph.max_degree(), 2);

  EXPECT_EQ(graph.degree(0), 2);
  EXPECT_EQ(graph.degree(3), 1);
  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1, 2));
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(0));
  EXPECT_THAT(to_vector(graph.neighbors(2)), ElementsAre(3));
  EXPECT_THAT(to_vector(graph.neighbors(3)), ElementsAre(2));
}

TEST(GraphTest, IteratesOverAllNodes) {
  const Graph graph = make_empty_graph(5);
  EXPECT_THAT(to_vector(graph.nodes()), ElementsAre(0, 1, 2, 3, 4));
  EXPECT_THAT(to_vector(graph.neighbors(2)), IsEmpty());
}

TEST(GraphTest, AcceptsDuplicatesAndSelfLoops) {
  const Graph graph = make_graph({{0, 1, 1}, {1}});
  EXPECT_NO_THROW(graph.validate());
  EXPECT_EQ(graph.degree(0), 3);
}

TEST(GraphTest, RejectsNonZeroFirstOffset) {
  const Graph graph = make_raw_graph({1, 2}, {0, 0});
  EXPECT_THAT(validation_error([&] { graph.validate(); }), HasSubstr("first edge offset"));
}

TEST(GraphTest, RejectsLastOffsetThatDoesNotMatchNumberOfEdges) {
  const Graph graph = make_raw_graph({0, 1, 3}, {0, 1});
  EXPECT_THAT(validation_error([&] { graph.validate(); }), HasSubstr("last edge offset"));
}

TEST(GraphTest, RejectsDecreasingOffsets) {
  const Graph graph = make_raw_graph({0, 2, 1, 3}, {0, 1, 2});
  EXPECT_THAT(validation_error([&] { graph.validate(); }), HasSubstr("non-decreasing"));
}

TEST(GraphTest, RejectsNeighborOutOfRange) {
  const Graph graph = make_raw_graph({0, 1, 2}, {1, 2});
  EXPECT_THROW(graph.validate(), LoadError);
}
} // namespace bigap::testing
