/*******************************************************************************
 * Swap-based local search that improves one bisection.
 *
 * @file:   local_search.h
 * @date:   04.03.2026
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <cstddef>

#include <tbb/parallel_sort.h>

#include "bigap/bigap.h"
#include "bigap/bisection/gain_table.h"

#include "bigap-common/assert.h"
#include "bigap-common/datastructures/static_array.h"
#include "bigap-common/logger.h"

namespace bigap {

struct LocalSearchResult {
  std::size_t num_rounds = 0;
  std::size_t num_swaps = 0;
  bool converged = false;
};

/*!
 * Improves a bisection by exchanging nodes between the two halves.
 *
 * Each round computes the move gain of every node, sorts both halves by decreasing gain (ties
 * by increasing original node ID) and walks the two lists in lockstep. The walk stops at the
 * first pair whose combined gain is not positive. A pair is only swapped if the exact gain of
 * the swap under the current side degrees is positive; thus, every swap strictly decreases the
 * total cost and the optimizer cannot oscillate. The optimizer converges when a round performs
 * no swap.
 */
template <typename CostModel> class LocalSearchOptimizer {
  SET_DEBUG(false);

public:
  explicit LocalSearchOptimizer(const BisectionContext &b_ctx) : _b_ctx(b_ctx) {}

  LocalSearchResult optimize(GainTable &table) const {
    const CostModel model(table.num_left(), table.num_right());
    table.compute_costs(model);

    StaticArray<NodeID> left_candidates(table.num_left(), static_array::noinit);
    StaticArray<NodeID> right_candidates(table.num_right(), static_array::noinit);

    LocalSearchResult result;
    while (result.num_rounds < _b_ctx.num_iterations) {
      ++result.num_rounds;

      table.compute_gains();
      collect_candidates(table, left_candidates, right_candidates);

      const std::size_t num_pairs = std::min(left_candidates.size(), right_candidates.size());
      std::size_t num_swaps = 0;

      for (std::size_t k = 0; k < num_pairs; ++k) {
        const NodeID a = left_candidates[k];
        const NodeID b = right_candidates[k];
        if (table.gain(a) + table.gain(b) <= 0.0f) {
          break;
        }

        if (table.swap_gain(a, b) > 0.0f) {
          IF_DBG {
            DBG << "swap " << table.node(a) << " <-> " << table.node(b) << ", "
                << V(table.swap_gain(a, b));
          }

          table.swap(a, b, model);
          ++num_swaps;
        }
      }

      DBG << "Round " << result.num_rounds << ": " << num_swaps << " swaps, "
          << V(table.total_cost());

      result.num_swaps += num_swaps;
      if (num_swaps == 0) {
        result.converged = true;
        break;
      }
    }

    KASSERT(
        table.count(GainTable::kLeft) == table.num_left(),
        "local search changed the size of the left half",
        assert::normal
    );

    return result;
  }

private:
  static void collect_candidates(
      const GainTable &table, StaticArray<NodeID> &left, StaticArray<NodeID> &right
  ) {
    std::size_t num_left = 0;
    std::size_t num_right = 0;
    for (NodeID i = 0; i < table.n(); ++i) {
      if (table.side(i) == GainTable::kLeft) {
        left[num_left++] = i;
      } else {
        right[num_right++] = i;
      }
    }

    // Original IDs are distinct, thus the order is total and does not depend on the sorting
    // algorithm
    const auto by_decreasing_gain = [&](const NodeID lhs, const NodeID rhs) {
      const Gain lhs_gain = table.gain(lhs);
      const Gain rhs_gain = table.gain(rhs);
      return lhs_gain > rhs_gain || (lhs_gain == rhs_gain && table.node(lhs) < table.node(rhs));
    };

    if (table.parallel()) {
      tbb::parallel_sort(left.begin(), left.end(), by_decreasing_gain);
      tbb::parallel_sort(right.begin(), right.end(), by_decreasing_gain);
    } else {
      std::sort(left.begin(), left.end(), by_decreasing_gain);
      std::sort(right.begin(), right.end(), by_decreasing_gain);
    }
  }

  const BisectionContext &_b_ctx;
};

} // namespace bigap
