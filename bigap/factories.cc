/*******************************************************************************
 * Factory functions to instantiate the reordering scheme based on the configured
 * gain model.
 *
 * @file:   factories.cc
 * @date:   05.03.2026
 ******************************************************************************/
#include "bigap/factories.h"

#include "bigap/bisection/recursive_bisection.h"
#include "bigap/gains/gain_models.h"

namespace bigap::factory {

std::unique_ptr<Partitioner> create_partitioner(const Graph &graph, const Context &ctx) {
  switch (ctx.bisection.gain_model) {
  case GainModel::DEFAULT:
    return std::make_unique<RecursiveBisectionPartitioner<DefaultCostModel>>(graph, ctx);

  case GainModel::APPROX_1:
    return std::make_unique<RecursiveBisectionPartitioner<Approx1CostModel>>(graph, ctx);

  case GainModel::APPROX_2:
    return std::make_unique<RecursiveBisectionPartitioner<Approx2CostModel>>(graph, ctx);
  }

  __builtin_unreachable();
}

} // namespace bigap::factory
