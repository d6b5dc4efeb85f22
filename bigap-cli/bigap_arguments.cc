/*******************************************************************************
 * Command line arguments for the reordering algorithm.
 *
 * @file:   bigap_arguments.cc
 * @date:   08.03.2026
 ******************************************************************************/
#include "bigap-cli/bigap_arguments.h"

#include "bigap/context_io.h"

namespace bigap {

void create_all_options(CLI::App *app, Context &ctx) {
  create_bisection_options(app, ctx);
  create_parallel_options(app, ctx);
  create_debug_options(app, ctx);
}

CLI::Option_group *create_bisection_options(CLI::App *app, Context &ctx) {
  auto *bisection = app->add_option_group("Bisection");

  bisection->add_option("--gain-model", ctx.bisection.gain_model)
      ->transform(CLI::CheckedTransformer(get_gain_models()).description(""))
      ->description(R"(Implementation of log2 used to estimate the cost of a neighbor:
  - default:  exact log2, small arguments are looked up in a table
  - approx-1: fast approximation (exponent and rational correction of the mantissa)
  - approx-2: faster approximation (exponent and linear mantissa term))")
      ->capture_default_str();
  bisection
      ->add_option(
          "-i,--iterations",
          ctx.bisection.num_iterations,
          "Maximum number of local search rounds per bisection."
      )
      ->check(CLI::NonNegativeNumber)
      ->capture_default_str();
  bisection
      ->add_option(
          "--max-depth",
          ctx.bisection.max_depth,
          "Subsets at this recursion depth are not split any further."
      )
      ->capture_default_str();
  bisection
      ->add_option(
          "-m,--min-partition-size",
          ctx.bisection.min_partition_size,
          "Subsets with at most this many nodes are not split any further."
      )
      ->capture_default_str();
  bisection->add_option("--leaf-ordering", ctx.bisection.leaf_ordering)
      ->transform(CLI::CheckedTransformer(get_leaf_orderings()).description(""))
      ->description(R"(Order of the nodes inside a leaf of the recursion:
  - sorted: by increasing node ID
  - keep:   as left by the last bisection)")
      ->capture_default_str();
  bisection
      ->add_flag_function(
          "--sort-leaf",
          [&](auto) { ctx.bisection.leaf_ordering = LeafOrdering::SORTED_BY_ID; },
          "Same as --leaf-ordering=sorted."
      )
      ->configurable(false);
  bisection
      ->add_flag_function(
          "--keep-leaf",
          [&](auto) { ctx.bisection.leaf_ordering = LeafOrdering::KEEP; },
          "Same as --leaf-ordering=keep."
      )
      ->configurable(false);

  return bisection;
}

CLI::Option_group *create_parallel_options(CLI::App *app, Context &ctx) {
  auto *parallel = app->add_option_group("Parallelism");

  parallel
      ->add_option(
          "--max-parallel-depth",
          ctx.parallel.max_parallel_depth,
          "Subproblems at this recursion depth or deeper are processed sequentially."
      )
      ->capture_default_str();
  parallel
      ->add_option(
          "--min-parallel-size",
          ctx.parallel.min_parallel_size,
          "Subproblems and loops over fewer nodes are processed sequentially."
      )
      ->capture_default_str();

  return parallel;
}

CLI::Option_group *create_debug_options(CLI::App *app, Context &ctx) {
  auto *debug = app->add_option_group("Debug");

  debug
      ->add_flag(
          "--validate-permutation",
          ctx.debug.validate_permutation,
          "Check that the computed node order is a permutation before writing it."
      )
      ->capture_default_str();

  return debug;
}

} // namespace bigap
