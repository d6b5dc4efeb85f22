#include <gmock/gmock.h>

#include "bigap-common/errors.h"

#include "apps/io/graph_io.h"
#include "apps/io/metis_parser.h"
#include "tests/io/io_test_helpers.h"
#include "tests/test_helpers.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace bigap::testing {
namespace {
Graph parse(const std::string &contents) {
  const std::string filename = scratch_file("graph.metis");
  write_text_file(filename, contents);
  return io::metis::read(filename);
}

std::string parse_error(const std::string &contents) {
  try {
    (void)parse(contents);
  } catch (const LoadError &e) {
    return e.what();
  }
  return "";
}
} // namespace

TEST(MetisParserTest, ReadsDirectedGraph) {
  const Graph graph = parse("4 5\n2 3\n1\n4\n3\n");

  EXPECT_EQ(graph.n(), 4);
  EXPECT_EQ(graph.m(), 5);
  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1, 2));
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(0));
  EXPECT_THAT(to_vector(graph.neighbors(2)), ElementsAre(3));
  EXPECT_THAT(to_vector(graph.neighbors(3)), ElementsAre(2));
}

TEST(MetisParserTest, ReadsThroughGenericInterface) {
  const std::string filename = scratch_file("generic.metis");
  write_text_file(filename, "2 1\n2\n\n");

  const Graph graph = io::read(filename, io::GraphFileFormat::METIS);
  EXPECT_EQ(graph.n(), 2);
  EXPECT_EQ(graph.m(), 1);
}

TEST(MetisParserTest, SkipsComments) {
  const Graph graph = parse("% header comment\n3 2\n% first node\n2\n3\n\n% trailing comment\n");

  EXPECT_EQ(graph.n(), 3);
  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1));
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(2));
  EXPECT_THAT(to_vector(graph.neighbors(2)), IsEmpty());
}

TEST(MetisParserTest, EmptyLinesAreNodesWithoutNeighbors) {
  const Graph graph = parse("3 1\n\n\n1\n");

  EXPECT_EQ(graph.degree(0), 0);
  EXPECT_EQ(graph.degree(1), 0);
  EXPECT_THAT(to_vector(graph.neighbors(2)), ElementsAre(0));
}

TEST(MetisParserTest, MissingNewlineAtEndOfFile) {
  const Graph graph = parse("2 2\n2\n1");
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(0));
}

TEST(MetisParserTest, ToleratesWhitespace) {
  const Graph graph = parse("2 3 \r\n 2  1\t\r\n2 \r\n");
  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1, 0));
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(1));
}

TEST(MetisParserTest, SkipsWeights) {
  // Node weights and edge weights
  const Graph graph = parse("3 3 11\n5 2 7 3 8\n1 1 9\n2\n");

  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1, 2));
  EXPECT_THAT(to_vector(graph.neighbors(1)), ElementsAre(0));
  EXPECT_THAT(to_vector(graph.neighbors(2)), IsEmpty());
}

TEST(MetisParserTest, ReadsGraphWithoutNodes) {
  EXPECT_EQ(parse("0 0\n").n(), 0);
}

TEST(MetisParserTest, RejectsNeighborOutOfRange) {
  EXPECT_THAT(parse_error("2 1\n3\n\n"), HasSubstr("out of range"));
  EXPECT_THAT(parse_error("2 1\n0\n\n"), HasSubstr("out of range"));
}

TEST(MetisParserTest, RejectsInvalidFormat) {
  EXPECT_THAT(parse_error("2 1 12\n2\n\n"), HasSubstr("invalid graph format"));
}

TEST(MetisParserTest, RejectsGarbage) {
  EXPECT_THAT(parse_error("2 1\n2 x\n\n"), HasSubstr("line 2"));
  EXPECT_THROW((void)parse(""), LoadError);
}

TEST(MetisParserTest, RejectsTruncatedFile) {
  EXPECT_THAT(parse_error("4 3\n2\n3"), HasSubstr("truncated"));
}
} // namespace bigap::testing
