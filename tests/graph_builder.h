#pragma once

#include <vector>

#include "bigap/datastructures/graph.h"

#include "bigap-common/datastructures/static_array.h"

namespace bigap::testing {
class GraphBuilder {
public:
  GraphBuilder() = default;

  GraphBuilder(const NodeID n, const EdgeID m) {
    _nodes.reserve(n + 1);
    _edges.reserve(m);
  }

  GraphBuilder(const GraphBuilder &) = delete;
  GraphBuilder &operator=(const GraphBuilder &) = delete;

  GraphBuilder(GraphBuilder &&) noexcept = default;
  GraphBuilder &operator=(GraphBuilder &&) noexcept = default;

  NodeID new_node() {
    _nodes.push_back(_edges.size());
    return static_cast<NodeID>(_nodes.size() - 1);
  }

  EdgeID new_edge(const NodeID v) {
    _edges.push_back(v);
    return _edges.size() - 1;
  }

  Graph build() {
    _nodes.push_back(_edges.size());
    return Graph(static_array::create(_nodes), static_array::create(_edges));
  }

private:
  std::vector<EdgeID> _nodes{};
  std::vector<NodeID> _edges{};
};
} // namespace bigap::testing
