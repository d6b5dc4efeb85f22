#include <cstdint>
#include <filesystem>

#include <gmock/gmock.h>

#include "bigap-common/errors.h"

#include "apps/io/bin_graph.h"
#include "apps/io/graph_io.h"
#include "tests/graph_factories.h"
#include "tests/io/io_test_helpers.h"
#include "tests/test_helpers.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace bigap::testing {
namespace {
template <typename Lambda> std::string load_error(Lambda &&l) {
  try {
    l();
  } catch (const LoadError &e) {
    return e.what();
  }
  return "";
}
} // namespace

TEST(BinGraphTest, ReadsHandWrittenFile) {
  const std::string filename = scratch_file("graph.bin");
  ByteBuffer()
      .append<std::uint64_t>(io::bin::kFingerprint)
      .append<std::uint32_t>(3)
      .append<std::uint64_t>(0)
      .append<std::uint64_t>(2)
      .append<std::uint64_t>(2)
      .append<std::uint64_t>(3)
      .append<std::uint32_t>(1)
      .append<std::uint32_t>(2)
      .append<std::uint32_t>(0)
      .write_to(filename);

  const Graph graph = io::read(filename, io::GraphFileFormat::BIN);
  EXPECT_EQ(graph.n(), 3);
  EXPECT_EQ(graph.m(), 3);
  EXPECT_THAT(to_vector(graph.neighbors(0)), ElementsAre(1, 2));
  EXPECT_EQ(graph.degree(1), 0);
  EXPECT_THAT(to_vector(graph.neighbors(2)), ElementsAre(0));
}

TEST(BinGraphTest, WrittenGraphCanBeReadAgain) {
  const std::string filename = scratch_file("random.bin");
  const Graph graph = make_pseudo_random_graph(200, 7);
  io::bin::write(filename, graph);

  const Graph read_graph = io::bin::read(filename);
  EXPECT_EQ(to_vector(read_graph.raw_nodes()), to_vector(graph.raw_nodes()));
  EXPECT_EQ(to_vector(read_graph.raw_edges()), to_vector(graph.raw_edges()));
}

TEST(BinGraphTest, ReadsGraphWithoutNodes) {
  const std::string filename = scratch_file("empty.bin");
  io::bin::write(filename, Graph());

  EXPECT_EQ(std::filesystem::file_size(filename), 8 + 4 + 8);
  EXPECT_EQ(io::bin::read(filename).n(), 0);
}

TEST(BinGraphTest, IgnoresTrailingBytes) {
  const std::string filename = scratch_file("trailing.bin");
  ByteBuffer()
      .append<std::uint64_t>(io::bin::kFingerprint)
      .append<std::uint32_t>(1)
      .append<std::uint64_t>(0)
      .append<std::uint64_t>(1)
      .append<std::uint32_t>(0)
      .append<std::uint8_t>(42)
      .write_to(filename);

  const Graph graph = io::bin::read(filename);
  EXPECT_EQ(graph.n(), 1);
  EXPECT_EQ(graph.m(), 1);
}

TEST(BinGraphTest, RejectsEmptyFile) {
  const std::string filename = scratch_file("zero.bin");
  write_text_file(filename, "");
  EXPECT_THAT(load_error([&] { (void)io::bin::read(filename); }), HasSubstr("truncated"));
}

TEST(BinGraphTest, RejectsMissingFile) {
  EXPECT_THROW((void)io::bin::read(scratch_file("missing.bin")), LoadError);
}

TEST(BinGraphTest, RejectsInvalidFingerprint) {
  const std::string filename = scratch_file("fingerprint.bin");
  ByteBuffer()
      .append<std::uint64_t>(0x1234)
      .append<std::uint32_t>(0)
      .append<std::uint64_t>(0)
      .write_to(filename);
  EXPECT_THAT(load_error([&] { (void)io::bin::read(filename); }), HasSubstr("fingerprint"));
}

TEST(BinGraphTest, RejectsTruncatedFile) {
  const std::string filename = scratch_file("truncated.bin");
  io::bin::write(filename, make_path_graph(10));
  std::filesystem::resize_file(filename, std::filesystem::file_size(filename) - 2);

  EXPECT_THAT(load_error([&] { (void)io::bin::read(filename); }), HasSubstr("out-neighbors"));

  std::filesystem::resize_file(filename, 8 + 4 + 8 * 5);
  EXPECT_THAT(load_error([&] { (void)io::bin::read(filename); }), HasSubstr("edge offsets"));
}

TEST(BinGraphTest, RejectsNeighborOutOfRange) {
  const std::string filename = scratch_file("range.bin");
  ByteBuffer()
      .append<std::uint64_t>(io::bin::kFingerprint)
      .append<std::uint32_t>(2)
      .append<std::uint64_t>(0)
      .append<std::uint64_t>(1)
      .append<std::uint64_t>(1)
      .append<std::uint32_t>(5)
      .write_to(filename);
  EXPECT_THAT(load_error([&] { (void)io::bin::read(filename); }), HasSubstr("points to node 5"));
}

TEST(BinGraphTest, RejectsDecreasingOffsets) {
  const std::string filename = scratch_file("offsets.bin");
  ByteBuffer()
      .append<std::uint64_t>(io::bin::kFingerprint)
      .append<std::uint32_t>(2)
      .append<std::uint64_t>(0)
      .append<std::uint64_t>(2)
      .append<std::uint64_t>(1)
      .append<std::uint32_t>(0)
      .write_to(filename);
  EXPECT_THROW((void)io::bin::read(filename), LoadError);
}
} // namespace bigap::testing
