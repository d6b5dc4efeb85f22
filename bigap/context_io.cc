/*******************************************************************************
 * IO functions for the context structs.
 *
 * @file:   context_io.cc
 * @date:   05.03.2026
 ******************************************************************************/
#include "bigap/context_io.h"

#include "bigap-common/console_io.h"

namespace bigap {
std::unordered_map<std::string, GainModel> get_gain_models() {
  return {
      {"default", GainModel::DEFAULT},
      {"approx-1", GainModel::APPROX_1},
      {"approx_1", GainModel::APPROX_1},
      {"approx-2", GainModel::APPROX_2},
      {"approx_2", GainModel::APPROX_2},
  };
}

std::ostream &operator<<(std::ostream &out, const GainModel model) {
  switch (model) {
  case GainModel::DEFAULT:
    return out << "default";
  case GainModel::APPROX_1:
    return out << "approx-1";
  case GainModel::APPROX_2:
    return out << "approx-2";
  }

  return out << "<invalid>";
}

std::unordered_map<std::string, LeafOrdering> get_leaf_orderings() {
  return {
      {"sorted", LeafOrdering::SORTED_BY_ID},
      {"sorted-by-id", LeafOrdering::SORTED_BY_ID},
      {"keep", LeafOrdering::KEEP},
  };
}

std::ostream &operator<<(std::ostream &out, const LeafOrdering ordering) {
  switch (ordering) {
  case LeafOrdering::SORTED_BY_ID:
    return out << "sorted-by-id";
  case LeafOrdering::KEEP:
    return out << "keep";
  }

  return out << "<invalid>";
}

void print(const BisectionContext &b_ctx, std::ostream &out) {
  out << "Gain model:                   " << b_ctx.gain_model << "\n";
  out << "Local search rounds:          " << b_ctx.num_iterations << "\n";
  out << "Max recursion depth:          " << b_ctx.max_depth << "\n";
  out << "Min partition size:           " << b_ctx.min_partition_size << "\n";
  out << "Leaf ordering:                " << b_ctx.leaf_ordering << "\n";
}

void print(const ParallelContext &p_ctx, std::ostream &out) {
  out << "Number of threads:            " << p_ctx.num_threads << "\n";
  out << "Spawn tasks:                  up to depth " << p_ctx.max_parallel_depth
      << ", for subsets with at least " << p_ctx.min_parallel_size << " nodes\n";
}

void print(const Context &ctx, std::ostream &out) {
  out << "Graph:                        " << ctx.debug.graph_name << "\n";
  out << "Validate permutation:         " << (ctx.debug.validate_permutation ? "yes" : "no")
      << "\n";
  cio::print_delimiter("Bisection", '-');
  print(ctx.bisection, out);
  cio::print_delimiter("Parallelism", '-');
  print(ctx.parallel, out);
}
} // namespace bigap
