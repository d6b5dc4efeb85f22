/*******************************************************************************
 * Utility functions for computing the quality of a node order.
 *
 * @file:   metrics.h
 * @date:   06.03.2026
 ******************************************************************************/
#pragma once

#include <span>

#include "bigap/bigap.h"
#include "bigap/datastructures/graph.h"

namespace bigap::metrics {

/*!
 * Estimates the size of the gap-encoded adjacency lists after relabeling the graph by the given
 * permutation: each list is sorted and every gap `g` costs `log2(g + 1)` bits. The first gap of
 * the list of `u` is measured relative to the new ID of `u`.
 *
 * @param graph The graph.
 * @param permutation Maps original node IDs to new node IDs.
 *
 * @return The estimated size in bits.
 */
[[nodiscard]] double log_gap_cost(const Graph &graph, std::span<const NodeID> permutation);

//! Estimated size in bits of the gap-encoded adjacency lists in the current order.
[[nodiscard]] double log_gap_cost(const Graph &graph);

//! Returns whether `permutation` maps `[0, n)` bijectively onto `[0, n)`.
[[nodiscard]] bool is_permutation(std::span<const NodeID> permutation);

} // namespace bigap::metrics
