/*******************************************************************************
 * Configuration presets.
 *
 * @file:   presets.cc
 * @date:   05.03.2026
 ******************************************************************************/
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "bigap/bigap.h"

namespace bigap {
namespace {
// Set at build time via -DBIGAP_GAIN_MODEL=...
constexpr GainModel kDefaultGainModel =
#if defined(BIGAP_GAIN_MODEL_APPROX_1)
    GainModel::APPROX_1;
#elif defined(BIGAP_GAIN_MODEL_APPROX_2)
    GainModel::APPROX_2;
#else
    GainModel::DEFAULT;
#endif
} // namespace

Context create_context_by_preset_name(const std::string &name) {
  if (name == "default") {
    return create_default_context();
  } else if (name == "fast") {
    return create_fast_context();
  } else if (name == "strong") {
    return create_strong_context();
  }

  throw std::runtime_error("invalid preset name");
}

std::unordered_set<std::string> get_preset_names() {
  return {
      "default",
      "fast",
      "strong",
  };
}

Context create_default_context() {
  return {
      .bisection =
          {
              .gain_model = kDefaultGainModel,
              .num_iterations = 20,
              .max_depth = 100,
              .min_partition_size = 16,
              .leaf_ordering = LeafOrdering::SORTED_BY_ID,
          },
      .parallel =
          {
              .num_threads = 1,
              .max_parallel_depth = 16,
              .min_parallel_size = 4096,
          },
      .debug =
          {
              .graph_name = "",
              .validate_permutation = false,
          },
  };
}

Context create_fast_context() {
  Context ctx = create_default_context();
  ctx.bisection.num_iterations = 5;
  ctx.bisection.min_partition_size = 64;
  return ctx;
}

Context create_strong_context() {
  Context ctx = create_default_context();
  ctx.bisection.num_iterations = 40;
  ctx.bisection.min_partition_size = 8;
  return ctx;
}
} // namespace bigap
