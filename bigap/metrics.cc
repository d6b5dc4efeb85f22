/*******************************************************************************
 * Utility functions for computing the quality of a node order.
 *
 * @file:   metrics.cc
 * @date:   06.03.2026
 ******************************************************************************/
#include "bigap/metrics.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>
#include <tbb/parallel_reduce.h>

#include "bigap-common/datastructures/static_array.h"

namespace bigap::metrics {
namespace {
template <typename Mapper> double log_gap_cost_impl(const Graph &graph, Mapper &&map) {
  tbb::enumerable_thread_specific<std::vector<NodeID>> buffer_ets;

  return tbb::parallel_deterministic_reduce(
      tbb::blocked_range<NodeID>(0, graph.n(), 1024),
      0.0,
      [&](const tbb::blocked_range<NodeID> &r, double cost) {
        std::vector<NodeID> &targets = buffer_ets.local();

        for (NodeID u = r.begin(); u != r.end(); ++u) {
          const auto neighbors = graph.neighbors(u);
          if (neighbors.empty()) {
            continue;
          }

          targets.clear();
          for (const NodeID v : neighbors) {
            targets.push_back(map(v));
          }
          std::sort(targets.begin(), targets.end());

          const NodeID source = map(u);
          NodeID prev = targets.front();
          const NodeID first_gap = (prev >= source) ? prev - source : source - prev;
          cost += std::log2(static_cast<double>(first_gap) + 1.0);

          for (auto it = targets.begin() + 1; it != targets.end(); ++it) {
            cost += std::log2(static_cast<double>(*it - prev) + 1.0);
            prev = *it;
          }
        }

        return cost;
      },
      std::plus<>{}
  );
}
} // namespace

double log_gap_cost(const Graph &graph, const std::span<const NodeID> permutation) {
  return log_gap_cost_impl(graph, [&](const NodeID u) { return permutation[u]; });
}

double log_gap_cost(const Graph &graph) {
  return log_gap_cost_impl(graph, [](const NodeID u) { return u; });
}

bool is_permutation(const std::span<const NodeID> permutation) {
  const std::size_t n = permutation.size();
  StaticArray<std::uint8_t> seen(n);

  for (const NodeID new_id : permutation) {
    if (new_id >= n || seen[new_id] != 0) {
      return false;
    }
    seen[new_id] = 1;
  }

  return true;
}

} // namespace bigap::metrics
