/*******************************************************************************
 * Node subset processed by one call of the recursive bisection.
 *
 * @file:   partition_context.h
 * @date:   04.03.2026
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <span>

#include "bigap/bigap.h"

#include "bigap-common/assert.h"

namespace bigap {

/*!
 * A contiguous range of the global node order together with its recursion depth. `offset` is the
 * position of the first node of the range in the global order; the nodes of the range receive the
 * new IDs `[offset, offset + size())`.
 */
struct PartitionContext {
  std::span<NodeID> nodes;
  NodeID offset;
  std::size_t depth;

  [[nodiscard]] NodeID size() const {
    return static_cast<NodeID>(nodes.size());
  }

  //! Context of the first `num_left` nodes, one level deeper.
  [[nodiscard]] PartitionContext left(const NodeID num_left) const {
    KASSERT(num_left <= size());
    return {nodes.first(num_left), offset, depth + 1};
  }

  //! Context of the nodes after the first `num_left` nodes, one level deeper.
  [[nodiscard]] PartitionContext right(const NodeID num_left) const {
    KASSERT(num_left <= size());
    return {nodes.subspan(num_left), offset + num_left, depth + 1};
  }
};

} // namespace bigap
