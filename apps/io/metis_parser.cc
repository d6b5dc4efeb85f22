/*******************************************************************************
 * Sequential parser for directed graphs in METIS format.
 *
 * @file:   metis_parser.cc
 * @date:   07.03.2026
 ******************************************************************************/
#include "apps/io/metis_parser.h"

#include <limits>
#include <sstream>
#include <vector>

#include "bigap-common/datastructures/static_array.h"
#include "bigap-common/logger.h"

#include "apps/io/file_toker.h"

namespace bigap::io::metis {

namespace {

struct MetisHeader {
  std::uint64_t num_nodes = 0;
  std::uint64_t num_edges = 0;
  bool has_node_sizes = false;
  bool has_node_weights = false;
  bool has_edge_weights = false;
};

MetisHeader parse_header(MappedFileToker &toker) {
  toker.skip_comments();

  const std::uint64_t num_nodes = toker.scan_uint();
  const std::uint64_t num_edges = toker.scan_uint();
  const std::uint64_t format = toker.at_line_end() ? 0 : toker.scan_uint();
  if (!toker.at_line_end()) {
    // Number of node weights per node: only a single weight is supported and it is skipped anyway
    toker.scan_uint();
  }
  if (toker.valid_position()) {
    toker.consume_char('\n');
  }

  if (format != 0 && format != 1 && format != 10 && format != 11 && format != 100 &&
      format != 110 && format != 101 && format != 111) {
    toker.fail("invalid graph format " + std::to_string(format));
  }

  if (num_nodes > static_cast<std::uint64_t>(std::numeric_limits<NodeID>::max()) - 1) {
    toker.fail("number of nodes is too large for the node ID type");
  }

  return {
      .num_nodes = num_nodes,
      .num_edges = num_edges,
      .has_node_sizes = format / 100 == 1,          // == 1xx
      .has_node_weights = (format % 100) / 10 == 1, // == x1x
      .has_edge_weights = format % 10 == 1,         // == xx1
  };
}

} // namespace

Graph read(const std::string &filename) {
  MappedFileToker toker(filename);
  const MetisHeader header = parse_header(toker);

  if (header.has_node_sizes || header.has_node_weights || header.has_edge_weights) {
    LOG_WARNING << "ignoring node and edge weights of " << filename;
  }

  StaticArray<EdgeID> nodes(header.num_nodes + 1, static_array::noinit);
  std::vector<NodeID> edges;
  edges.reserve(header.num_edges);

  for (std::uint64_t u = 0; u < header.num_nodes; ++u) {
    // Empty lines are nodes without out-neighbors
    toker.skip_comments(false);
    nodes[u] = edges.size();

    if (header.has_node_sizes) {
      toker.scan_uint();
    }
    if (header.has_node_weights) {
      toker.scan_uint();
    }

    while (!toker.at_line_end()) {
      const std::uint64_t v = toker.scan_uint();
      if (v == 0 || v > header.num_nodes) {
        std::stringstream ss;
        ss << "neighbor " << v << " of node " << (u + 1) << " is out of range [1, "
           << header.num_nodes << "]";
        toker.fail(ss.str());
      }
      edges.push_back(static_cast<NodeID>(v - 1));

      if (header.has_edge_weights) {
        toker.scan_uint();
      }
    }

    if (toker.valid_position()) {
      toker.consume_char('\n');
    } else if (u + 1 < header.num_nodes) {
      std::stringstream ss;
      ss << filename << " is truncated: expected " << header.num_nodes
         << " adjacency lists, but found only " << (u + 1);
      throw LoadError(ss.str());
    }
  }
  nodes[header.num_nodes] = edges.size();

  toker.skip_comments();
  if (toker.valid_position()) {
    LOG_WARNING << "ignoring extra lines in " << filename;
  }

  Graph graph(std::move(nodes), static_array::create(edges));
  graph.validate();
  return graph;
}

} // namespace bigap::io::metis
