/*******************************************************************************
 * Static directed graph in CSR representation.
 *
 * @file:   graph.h
 * @date:   03.03.2026
 ******************************************************************************/
#pragma once

#include <ranges>
#include <span>

#include "bigap/bigap.h"

#include "bigap-common/assert.h"
#include "bigap-common/datastructures/static_array.h"

namespace bigap {

/*!
 * Immutable directed graph: the out-neighbors of node `u` are
 * `edges[nodes[u]..nodes[u + 1] - 1]`. Adjacency lists may contain duplicates and self-loops.
 */
class Graph {
public:
  Graph();

  //! Takes ownership of the given CSR arrays. The arrays are not checked; call `validate()` for
  //! input that does not come from a trusted source.
  Graph(StaticArray<EdgeID> nodes, StaticArray<NodeID> edges);

  Graph(const Graph &) = delete;
  Graph &operator=(const Graph &) = delete;

  Graph(Graph &&) noexcept = default;
  Graph &operator=(Graph &&) noexcept = default;

  //! Checks the CSR invariants: `nodes[0] = 0`, non-decreasing offsets, `nodes[n] = m` and every
  //! neighbor in `[0, n)`. Throws `LoadError` describing the first violation found.
  void validate() const;

  //
  // Size of the graph
  //

  [[nodiscard]] inline NodeID n() const {
    return static_cast<NodeID>(_nodes.size() - 1);
  }

  [[nodiscard]] inline EdgeID m() const {
    return static_cast<EdgeID>(_edges.size());
  }

  //
  // Nodes and their adjacency lists
  //

  [[nodiscard]] inline auto nodes() const {
    return std::views::iota(static_cast<NodeID>(0), n());
  }

  [[nodiscard]] inline NodeID degree(const NodeID u) const {
    KASSERT(u < n());
    return static_cast<NodeID>(_nodes[u + 1] - _nodes[u]);
  }

  [[nodiscard]] inline NodeID max_degree() const {
    return _max_degree;
  }

  [[nodiscard]] inline std::span<const NodeID> neighbors(const NodeID u) const {
    KASSERT(u < n());
    return {_edges.data() + _nodes[u], _edges.data() + _nodes[u + 1]};
  }

  [[nodiscard]] inline EdgeID first_edge(const NodeID u) const {
    return _nodes[u];
  }

  [[nodiscard]] inline EdgeID first_invalid_edge(const NodeID u) const {
    return _nodes[u + 1];
  }

  //
  // Access to the underlying arrays
  //

  [[nodiscard]] inline const StaticArray<EdgeID> &raw_nodes() const {
    return _nodes;
  }

  [[nodiscard]] inline const StaticArray<NodeID> &raw_edges() const {
    return _edges;
  }

private:
  StaticArray<EdgeID> _nodes;
  StaticArray<NodeID> _edges;

  NodeID _max_degree = 0;
};

} // namespace bigap
