/*******************************************************************************
 * Command line arguments for the reordering algorithm.
 *
 * @file:   bigap_arguments.h
 * @date:   08.03.2026
 ******************************************************************************/
#pragma once

#include <CLI/CLI.hpp>

#include "bigap/bigap.h"

namespace bigap {
void create_all_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_bisection_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_parallel_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_debug_options(CLI::App *app, Context &ctx);
} // namespace bigap
