/*******************************************************************************
 * Reordering scheme based on recursive graph bisection.
 *
 * @file:   recursive_bisection.cc
 * @date:   05.03.2026
 ******************************************************************************/
#include "bigap/bisection/recursive_bisection.h"

#include <algorithm>
#include <sstream>

#include <tbb/parallel_for.h>
#include <tbb/parallel_sort.h>

#include "bigap/bisection/gain_table.h"
#include "bigap/gains/gain_models.h"

#include "bigap-common/errors.h"
#include "bigap-common/logger.h"
#include "bigap-common/math.h"
#include "bigap-common/timer.h"

namespace bigap {
namespace {
SET_DEBUG(false);

void atomic_max(std::atomic<std::size_t> &target, const std::size_t value) {
  std::size_t current = target.load(std::memory_order_relaxed);
  while (current < value &&
         !target.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
  }
}
} // namespace

template <typename CostModel>
RecursiveBisectionPartitioner<CostModel>::RecursiveBisectionPartitioner(
    const Graph &graph, const Context &ctx
)
    : _graph(graph),
      _ctx(ctx),
      _optimizer(ctx.bisection),
      _scheduler(ctx.parallel),
      _assembler(graph.n()) {}

template <typename CostModel>
StaticArray<NodeID> RecursiveBisectionPartitioner<CostModel>::compute_permutation() {
  const NodeID n = _graph.n();

  START_TIMER("Initial order");
  StaticArray<NodeID> order(n, static_array::noinit);
  tbb::parallel_for<NodeID>(0, n, [&](const NodeID u) { order[u] = u; });
  tbb::parallel_sort(order.begin(), order.end(), [&](const NodeID u, const NodeID v) {
    const NodeID u_degree = _graph.degree(u);
    const NodeID v_degree = _graph.degree(v);
    return u_degree > v_degree || (u_degree == v_degree && u < v);
  });

  const NodeID num_non_isolated = static_cast<NodeID>(
      std::partition_point(
          order.begin(), order.end(), [&](const NodeID u) { return _graph.degree(u) > 0; }
      ) -
      order.begin()
  );
  STOP_TIMER();

  DBG << "Bisecting " << num_non_isolated << " of " << n << " nodes";

  START_TIMER("Bisection");
  recurse({std::span<NodeID>(order.data(), num_non_isolated), 0, 0});
  STOP_TIMER();

  // Nodes without out-neighbors are already sorted by increasing ID
  if (num_non_isolated < n) {
    _assembler.add_leaf(
        num_non_isolated, std::span<const NodeID>(order.data() + num_non_isolated, order.end())
    );
  }

  SCOPED_TIMER("Assemble permutation");
  return _assembler.finalize();
}

template <typename CostModel>
void RecursiveBisectionPartitioner<CostModel>::recurse(PartitionContext p_ctx) {
  atomic_max(_max_depth, p_ctx.depth);

  if (p_ctx.size() <= 1 || p_ctx.depth >= _ctx.bisection.max_depth) {
    finish_leaf(p_ctx);
    return;
  }

  const NodeID num_left = bisect(p_ctx);
  const NodeID num_right = p_ctx.size() - num_left;
  if (num_left < num_right || num_left - num_right > 1) {
    std::stringstream ss;
    ss << "unbalanced split at depth " << p_ctx.depth << ": " << num_left << " nodes left and "
       << num_right << " nodes right";
    throw InternalError(ss.str());
  }

  const PartitionContext left = p_ctx.left(num_left);
  const PartitionContext right = p_ctx.right(num_left);

  const auto process = [&](const PartitionContext &child) {
    if (is_leaf(child)) {
      atomic_max(_max_depth, child.depth);
      finish_leaf(child);
    } else {
      recurse(child);
    }
  };

  _scheduler.invoke(p_ctx, [&] { process(left); }, [&] { process(right); });
}

template <typename CostModel>
NodeID RecursiveBisectionPartitioner<CostModel>::bisect(PartitionContext &p_ctx) {
  const auto [num_left, num_right] = math::split_balanced(p_ctx.size());
  _num_bisections.fetch_add(1, std::memory_order_relaxed);

  // Two nodes: one per side, there is nothing to optimize
  if (p_ctx.size() == 2) {
    return num_left;
  }

  GainTable table(_graph, p_ctx.nodes, num_left, _scheduler.should_parallelize(p_ctx));
  const LocalSearchResult result = _optimizer.optimize(table);
  table.write_back(p_ctx.nodes);

  DBG << "Bisected " << p_ctx.size() << " nodes at depth " << p_ctx.depth << " into "
      << num_left << " + " << num_right << " nodes: " << result.num_swaps << " swaps in "
      << result.num_rounds << " rounds";

  _num_rounds.fetch_add(result.num_rounds, std::memory_order_relaxed);
  _num_swaps.fetch_add(result.num_swaps, std::memory_order_relaxed);
  if (!result.converged) {
    _num_unconverged.fetch_add(1, std::memory_order_relaxed);
  }

  return table.count(GainTable::kLeft);
}

template <typename CostModel>
void RecursiveBisectionPartitioner<CostModel>::finish_leaf(PartitionContext p_ctx) {
  if (p_ctx.size() == 0) {
    return;
  }

  if (_ctx.bisection.leaf_ordering == LeafOrdering::SORTED_BY_ID) {
    std::sort(p_ctx.nodes.begin(), p_ctx.nodes.end());
  }

  _assembler.add_leaf(p_ctx.offset, p_ctx.nodes);
}

template <typename CostModel>
bool RecursiveBisectionPartitioner<CostModel>::is_leaf(const PartitionContext &p_ctx) const {
  return p_ctx.size() <= std::max<NodeID>(1, _ctx.bisection.min_partition_size) ||
         p_ctx.depth >= _ctx.bisection.max_depth;
}

template <typename CostModel>
BisectionStatistics RecursiveBisectionPartitioner<CostModel>::statistics() const {
  return {
      .num_bisections = _num_bisections.load(std::memory_order_relaxed),
      .num_leaves = _assembler.num_leaves(),
      .num_rounds = _num_rounds.load(std::memory_order_relaxed),
      .num_swaps = _num_swaps.load(std::memory_order_relaxed),
      .num_unconverged = _num_unconverged.load(std::memory_order_relaxed),
      .num_parallel_tasks = _scheduler.num_spawned(),
      .max_depth = _max_depth.load(std::memory_order_relaxed),
  };
}

template class RecursiveBisectionPartitioner<DefaultCostModel>;
template class RecursiveBisectionPartitioner<Approx1CostModel>;
template class RecursiveBisectionPartitioner<Approx2CostModel>;

} // namespace bigap
