/*******************************************************************************
 * Reordering scheme based on recursive graph bisection.
 *
 * @file:   recursive_bisection.h
 * @date:   05.03.2026
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

#include "bigap/bigap.h"
#include "bigap/bisection/local_search.h"
#include "bigap/bisection/parallel_scheduler.h"
#include "bigap/bisection/partition_context.h"
#include "bigap/bisection/partitioner.h"
#include "bigap/bisection/permutation_assembler.h"
#include "bigap/datastructures/graph.h"

#include "bigap-common/datastructures/static_array.h"

namespace bigap {

/*!
 * Computes a node order by recursive graph bisection:
 *
 * 1. Nodes are ordered by decreasing out-degree (ties by increasing ID). Nodes without
 *    out-neighbors are excluded from the recursion and placed at the end of the order.
 * 2. A subset of n nodes is split into its first ceil(n/2) and its last floor(n/2) nodes and the
 *    split is improved by local search.
 * 3. Both halves are processed recursively until they become leaves, i.e., until they are not
 *    larger than the minimum partition size or reach the maximum recursion depth.
 * 4. Leaves are ordered by increasing node ID or kept as they are and claim the new IDs of their
 *    range of the global order.
 *
 * @tparam CostModel The model used to estimate the gap-encoding cost of neighbors.
 */
template <typename CostModel> class RecursiveBisectionPartitioner : public Partitioner {
public:
  RecursiveBisectionPartitioner(const Graph &graph, const Context &ctx);

  RecursiveBisectionPartitioner(const RecursiveBisectionPartitioner &) = delete;
  RecursiveBisectionPartitioner &operator=(const RecursiveBisectionPartitioner &) = delete;

  [[nodiscard]] StaticArray<NodeID> compute_permutation() final;

  [[nodiscard]] BisectionStatistics statistics() const final;

  //! Ranges of the global order that became leaves, sorted by position.
  [[nodiscard]] std::vector<std::pair<NodeID, NodeID>> leaf_ranges() const {
    return _assembler.leaf_ranges();
  }

private:
  void recurse(PartitionContext p_ctx);

  //! Splits the context and improves the split; returns the size of the left half.
  NodeID bisect(PartitionContext &p_ctx);

  void finish_leaf(PartitionContext p_ctx);

  [[nodiscard]] bool is_leaf(const PartitionContext &p_ctx) const;

  const Graph &_graph;
  const Context &_ctx;

  LocalSearchOptimizer<CostModel> _optimizer;
  ParallelScheduler _scheduler;
  PermutationAssembler _assembler;

  std::atomic<std::size_t> _num_bisections = 0;
  std::atomic<std::size_t> _num_rounds = 0;
  std::atomic<std::size_t> _num_swaps = 0;
  std::atomic<std::size_t> _num_unconverged = 0;
  std::atomic<std::size_t> _max_depth = 0;
};

} // namespace bigap
