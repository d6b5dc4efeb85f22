/*******************************************************************************
 * Decides whether independent subproblems of the recursion run in parallel.
 *
 * @file:   parallel_scheduler.h
 * @date:   04.03.2026
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstddef>

#include <tbb/parallel_invoke.h>

#include "bigap/bigap.h"
#include "bigap/bisection/partition_context.h"

namespace bigap {

class ParallelScheduler {
public:
  explicit ParallelScheduler(const ParallelContext &p_ctx) : _p_ctx(p_ctx) {}

  ParallelScheduler(const ParallelScheduler &) = delete;
  ParallelScheduler &operator=(const ParallelScheduler &) = delete;

  //! Whether the children of the given context should be processed as parallel tasks.
  [[nodiscard]] bool should_spawn(const PartitionContext &p_ctx) const {
    return _p_ctx.num_threads > 1 && p_ctx.depth < _p_ctx.max_parallel_depth &&
           p_ctx.size() >= _p_ctx.min_parallel_size;
  }

  //! Whether loops over the nodes of the given context should run in parallel.
  [[nodiscard]] bool should_parallelize(const PartitionContext &p_ctx) const {
    return _p_ctx.num_threads > 1 && p_ctx.size() >= _p_ctx.min_parallel_size;
  }

  /*!
   * Runs both subproblems of the given context and returns once both completed. Exceptions
   * thrown by either subproblem are propagated to the caller.
   */
  template <typename Left, typename Right>
  void invoke(const PartitionContext &p_ctx, Left &&left, Right &&right) {
    if (should_spawn(p_ctx)) {
      _num_spawned.fetch_add(1, std::memory_order_relaxed);
      tbb::parallel_invoke(std::forward<Left>(left), std::forward<Right>(right));
    } else {
      left();
      right();
    }
  }

  //! Number of calls to `invoke()` that ran their subproblems as parallel tasks.
  [[nodiscard]] std::size_t num_spawned() const {
    return _num_spawned.load(std::memory_order_relaxed);
  }

private:
  const ParallelContext &_p_ctx;
  std::atomic<std::size_t> _num_spawned = 0;
};

} // namespace bigap
