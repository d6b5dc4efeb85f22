/*******************************************************************************
 * Static directed graph in CSR representation.
 *
 * @file:   graph.cc
 * @date:   03.03.2026
 ******************************************************************************/
#include "bigap/datastructures/graph.h"

#include <algorithm>
#include <sstream>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "bigap-common/errors.h"

namespace bigap {

Graph::Graph() : _nodes(1) {}

Graph::Graph(StaticArray<EdgeID> nodes, StaticArray<NodeID> edges)
    : _nodes(std::move(nodes)),
      _edges(std::move(edges)) {
  if (_nodes.empty()) {
    _nodes.resize(1);
  }

  // Offsets are not validated yet: treat decreasing offsets as empty lists
  _max_degree = tbb::parallel_reduce(
      tbb::blocked_range<NodeID>(0, n()),
      static_cast<NodeID>(0),
      [&](const auto &r, NodeID max_degree) {
        for (NodeID u = r.begin(); u != r.end(); ++u) {
          if (_nodes[u + 1] > _nodes[u]) {
            max_degree = std::max(max_degree, static_cast<NodeID>(_nodes[u + 1] - _nodes[u]));
          }
        }
        return max_degree;
      },
      [](const NodeID lhs, const NodeID rhs) { return std::max(lhs, rhs); }
  );
}

void Graph::validate() const {
  if (_nodes.front() != 0) {
    throw LoadError("first edge offset must be 0, but is " + std::to_string(_nodes.front()));
  }

  if (_nodes.back() != m()) {
    std::stringstream ss;
    ss << "last edge offset must equal the number of edges " << m() << ", but is "
       << _nodes.back();
    throw LoadError(ss.str());
  }

  // Find the first violation so that the error message does not depend on scheduling
  const NodeID first_bad_offset = tbb::parallel_reduce(
      tbb::blocked_range<NodeID>(0, n()),
      n(),
      [&](const auto &r, NodeID first) {
        for (NodeID u = r.begin(); u != r.end() && u < first; ++u) {
          if (_nodes[u] > _nodes[u + 1]) {
            first = u;
          }
        }
        return first;
      },
      [](const NodeID lhs, const NodeID rhs) { return std::min(lhs, rhs); }
  );
  if (first_bad_offset != n()) {
    std::stringstream ss;
    ss << "edge offsets must be non-decreasing, but node " << first_bad_offset << " starts at "
       << _nodes[first_bad_offset] << " and ends at " << _nodes[first_bad_offset + 1];
    throw LoadError(ss.str());
  }

  const EdgeID first_bad_edge = tbb::parallel_reduce(
      tbb::blocked_range<EdgeID>(0, m()),
      m(),
      [&](const auto &r, EdgeID first) {
        for (EdgeID e = r.begin(); e != r.end() && e < first; ++e) {
          if (_edges[e] >= n()) {
            first = e;
          }
        }
        return first;
      },
      [](const EdgeID lhs, const EdgeID rhs) { return std::min(lhs, rhs); }
  );
  if (first_bad_edge != m()) {
    std::stringstream ss;
    ss << "edge " << first_bad_edge << " points to node " << _edges[first_bad_edge]
       << ", but the graph only has " << n() << " nodes";
    throw LoadError(ss.str());
  }
}

} // namespace bigap
