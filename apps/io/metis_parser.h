/*******************************************************************************
 * Sequential parser for directed graphs in METIS format.
 *
 * @file:   metis_parser.h
 * @date:   07.03.2026
 ******************************************************************************/
#pragma once

#include <string>

#include "bigap/datastructures/graph.h"

namespace bigap::io::metis {

/*!
 * Reads a graph in METIS format: a header line `n m [fmt]` followed by one line per node listing
 * its 1-based out-neighbors. Lines starting with `%` are comments. Node sizes, node weights and
 * edge weights announced by `fmt` are skipped. Each line is an out-neighbor list, i.e., the graph
 * is not required to be symmetric, and `m` is only used as a size hint.
 *
 * @throws LoadError if the file cannot be parsed or lists a neighbor outside of [1, n].
 */
[[nodiscard]] Graph read(const std::string &filename);

} // namespace bigap::io::metis
