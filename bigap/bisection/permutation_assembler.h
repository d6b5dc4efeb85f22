/*******************************************************************************
 * Collects the node orders of all leaves into one global permutation.
 *
 * @file:   permutation_assembler.h
 * @date:   05.03.2026
 ******************************************************************************/
#pragma once

#include <span>
#include <utility>
#include <vector>

#include <tbb/concurrent_vector.h>

#include "bigap/bigap.h"

#include "bigap-common/datastructures/static_array.h"

namespace bigap {

/*!
 * Builds the permutation `perm[old_id] = new_id`. Every leaf of the recursion owns a contiguous
 * range of new IDs and reports its nodes in their final order. Leaves may report concurrently as
 * long as their ranges are disjoint.
 */
class PermutationAssembler {
public:
  explicit PermutationAssembler(NodeID n);

  PermutationAssembler(const PermutationAssembler &) = delete;
  PermutationAssembler &operator=(const PermutationAssembler &) = delete;

  /*!
   * Assigns the new IDs `[offset, offset + nodes.size())` to the given nodes in order.
   * Throws `InternalError` if the range exceeds `[0, n)` or a node ID is out of range.
   */
  void add_leaf(NodeID offset, std::span<const NodeID> nodes);

  /*!
   * Checks that the reported ranges are disjoint and cover `[0, n)` and that every node received
   * a new ID, then returns the permutation. Throws `InternalError` otherwise.
   */
  [[nodiscard]] StaticArray<NodeID> finalize();

  [[nodiscard]] std::size_t num_leaves() const {
    return _ranges.size();
  }

  //! Ranges `[begin, end)` of new IDs claimed by the leaves so far, sorted by position.
  [[nodiscard]] std::vector<std::pair<NodeID, NodeID>> leaf_ranges() const;

private:
  NodeID _n;
  StaticArray<NodeID> _permutation;
  tbb::concurrent_vector<std::pair<NodeID, NodeID>> _ranges;
};

} // namespace bigap
