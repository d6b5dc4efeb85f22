/*******************************************************************************
 * Interface for reordering schemes.
 *
 * @file:   partitioner.h
 * @date:   05.03.2026
 ******************************************************************************/
#pragma once

#include <cstddef>

#include "bigap/bigap.h"

#include "bigap-common/datastructures/static_array.h"

namespace bigap {

struct BisectionStatistics {
  std::size_t num_bisections = 0;
  std::size_t num_leaves = 0;
  std::size_t num_rounds = 0;
  std::size_t num_swaps = 0;
  std::size_t num_unconverged = 0;
  std::size_t num_parallel_tasks = 0;
  std::size_t max_depth = 0;
};

class Partitioner {
public:
  virtual ~Partitioner() = default;

  //! Computes the permutation `perm[old_id] = new_id` of the graph.
  [[nodiscard]] virtual StaticArray<NodeID> compute_permutation() = 0;

  [[nodiscard]] virtual BisectionStatistics statistics() const = 0;
};

} // namespace bigap
