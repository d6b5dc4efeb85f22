/*******************************************************************************
 * Factory functions to instantiate the reordering scheme based on the configured
 * gain model.
 *
 * @file:   factories.h
 * @date:   05.03.2026
 ******************************************************************************/
#pragma once

#include <memory>

#include "bigap/bigap.h"
#include "bigap/bisection/partitioner.h"
#include "bigap/datastructures/graph.h"

namespace bigap::factory {
std::unique_ptr<Partitioner> create_partitioner(const Graph &graph, const Context &ctx);
} // namespace bigap::factory
