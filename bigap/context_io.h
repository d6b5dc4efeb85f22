/*******************************************************************************
 * IO functions for the context structs.
 *
 * @file:   context_io.h
 * @date:   05.03.2026
 ******************************************************************************/
#pragma once

#include <iostream>
#include <string>
#include <unordered_map>

#include "bigap/bigap.h"

namespace bigap {
std::ostream &operator<<(std::ostream &out, GainModel model);

std::unordered_map<std::string, GainModel> get_gain_models();

std::ostream &operator<<(std::ostream &out, LeafOrdering ordering);

std::unordered_map<std::string, LeafOrdering> get_leaf_orderings();

void print(const Context &ctx, std::ostream &out);
void print(const BisectionContext &b_ctx, std::ostream &out);
void print(const ParallelContext &p_ctx, std::ostream &out);
} // namespace bigap
