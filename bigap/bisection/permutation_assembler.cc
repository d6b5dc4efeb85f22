/*******************************************************************************
 * Collects the node orders of all leaves into one global permutation.
 *
 * @file:   permutation_assembler.cc
 * @date:   05.03.2026
 ******************************************************************************/
#include "bigap/bisection/permutation_assembler.h"

#include <algorithm>
#include <sstream>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "bigap-common/errors.h"

namespace bigap {

PermutationAssembler::PermutationAssembler(const NodeID n)
    : _n(n),
      _permutation(n, kInvalidNodeID) {}

void PermutationAssembler::add_leaf(const NodeID offset, std::span<const NodeID> nodes) {
  if (offset > _n || nodes.size() > _n - offset) {
    std::stringstream ss;
    ss << "leaf range [" << offset << ", " << offset + nodes.size() << ") exceeds [0, " << _n
       << ")";
    throw InternalError(ss.str());
  }

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const NodeID u = nodes[i];
    if (u >= _n) {
      std::stringstream ss;
      ss << "leaf at position " << offset << " contains node " << u << ", but there are only "
         << _n << " nodes";
      throw InternalError(ss.str());
    }

    _permutation[u] = offset + static_cast<NodeID>(i);
  }

  _ranges.emplace_back(offset, offset + static_cast<NodeID>(nodes.size()));
}

std::vector<std::pair<NodeID, NodeID>> PermutationAssembler::leaf_ranges() const {
  std::vector<std::pair<NodeID, NodeID>> ranges(_ranges.begin(), _ranges.end());
  std::sort(ranges.begin(), ranges.end());
  return ranges;
}

StaticArray<NodeID> PermutationAssembler::finalize() {
  const std::vector<std::pair<NodeID, NodeID>> ranges = leaf_ranges();

  NodeID next = 0;
  for (const auto &[begin, end] : ranges) {
    if (begin < next) {
      std::stringstream ss;
      ss << "leaf ranges overlap: [" << begin << ", " << end << ") starts before position "
         << next;
      throw InternalError(ss.str());
    }
    if (begin > next) {
      std::stringstream ss;
      ss << "positions [" << next << ", " << begin << ") were not claimed by any leaf";
      throw InternalError(ss.str());
    }
    next = end;
  }
  if (next != _n) {
    std::stringstream ss;
    ss << "positions [" << next << ", " << _n << ") were not claimed by any leaf";
    throw InternalError(ss.str());
  }

  // The ranges cover every position exactly once, i.e., exactly n positions were assigned. If a
  // node is missing, another one was reported twice.
  const NodeID first_lost = tbb::parallel_reduce(
      tbb::blocked_range<NodeID>(0, _n),
      _n,
      [&](const auto &r, NodeID first) {
        for (NodeID u = r.begin(); u != r.end() && u < first; ++u) {
          if (_permutation[u] == kInvalidNodeID) {
            first = u;
          }
        }
        return first;
      },
      [](const NodeID lhs, const NodeID rhs) { return std::min(lhs, rhs); }
  );
  if (first_lost != _n) {
    std::stringstream ss;
    ss << "node " << first_lost << " was not assigned to any leaf";
    throw InternalError(ss.str());
  }

  return std::move(_permutation);
}

} // namespace bigap
