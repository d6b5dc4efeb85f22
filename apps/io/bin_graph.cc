/*******************************************************************************
 * Reader and writer for uncompressed graphs in the "bin" format.
 *
 * @file:   bin_graph.cc
 * @date:   07.03.2026
 ******************************************************************************/
#include "apps/io/bin_graph.h"

#include <limits>
#include <sstream>

#include <tbb/parallel_for.h>

#include "bigap-common/datastructures/static_array.h"
#include "bigap-common/errors.h"
#include "bigap-common/logger.h"

#include "apps/io/binary_util.h"

namespace bigap::io::bin {

namespace {
constexpr std::size_t kFingerprintOffset = 0;
constexpr std::size_t kNumNodesOffset = kFingerprintOffset + sizeof(std::uint64_t);
constexpr std::size_t kOffsetsOffset = kNumNodesOffset + sizeof(std::uint32_t);
} // namespace

Graph read(const std::string &filename) {
  BinaryReader reader(filename);

  reader.require(kFingerprintOffset, sizeof(std::uint64_t), "the fingerprint");
  const auto fingerprint = reader.read<std::uint64_t>(kFingerprintOffset);
  if (fingerprint != kFingerprint) {
    std::stringstream ss;
    ss << filename << " has an invalid fingerprint: expected " << kFingerprint << ", got "
       << fingerprint;
    throw LoadError(ss.str());
  }

  reader.require(kNumNodesOffset, sizeof(std::uint32_t), "the number of nodes");
  const std::uint64_t n = reader.read<std::uint32_t>(kNumNodesOffset);
  if (n > static_cast<std::uint64_t>(std::numeric_limits<NodeID>::max()) - 1) {
    throw LoadError("number of nodes is too large for the node ID type");
  }

  reader.require(kOffsetsOffset, (n + 1) * sizeof(std::uint64_t), "the edge offsets");
  const std::size_t edges_offset = kOffsetsOffset + (n + 1) * sizeof(std::uint64_t);
  const auto m = reader.read<std::uint64_t>(edges_offset - sizeof(std::uint64_t));
  if (m > (std::numeric_limits<std::size_t>::max() - edges_offset) / sizeof(std::uint32_t)) {
    throw LoadError("number of edges stored in " + filename + " is impossibly large");
  }
  reader.require(edges_offset, m * sizeof(std::uint32_t), "the out-neighbors");

  const std::size_t expected_length = edges_offset + m * sizeof(std::uint32_t);
  if (reader.length() > expected_length) {
    LOG_WARNING << "ignoring " << (reader.length() - expected_length) << " extra bytes at the end of "
                << filename;
  }

  StaticArray<EdgeID> nodes(n + 1, static_array::noinit);
  StaticArray<NodeID> edges(m, static_array::noinit);

  tbb::parallel_for<std::size_t>(0, n + 1, [&](const std::size_t u) {
    nodes[u] = reader.read<std::uint64_t>(kOffsetsOffset + u * sizeof(std::uint64_t));
  });
  tbb::parallel_for<std::size_t>(0, m, [&](const std::size_t e) {
    edges[e] = static_cast<NodeID>(
        reader.read<std::uint32_t>(edges_offset + e * sizeof(std::uint32_t))
    );
  });

  Graph graph(std::move(nodes), std::move(edges));
  graph.validate();
  return graph;
}

void write(const std::string &filename, const Graph &graph) {
  if (static_cast<std::uint64_t>(graph.n()) > std::numeric_limits<std::uint32_t>::max()) {
    throw LoadError("graph has too many nodes for the bin format");
  }

  BinaryWriter writer(filename);
  writer.write_int<std::uint64_t>(kFingerprint);
  writer.write_int<std::uint32_t>(static_cast<std::uint32_t>(graph.n()));

  for (const EdgeID offset : graph.raw_nodes()) {
    writer.write_int<std::uint64_t>(offset);
  }
  for (const NodeID v : graph.raw_edges()) {
    writer.write_int<std::uint32_t>(static_cast<std::uint32_t>(v));
  }

  writer.close();
}

} // namespace bigap::io::bin
