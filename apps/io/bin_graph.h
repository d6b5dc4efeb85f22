/*******************************************************************************
 * Reader and writer for uncompressed graphs in the "bin" format:
 *
 * - 8 bytes: fingerprint (sizeof(u64) << 4) | sizeof(u32)
 * - 4 bytes: number of nodes N
 * - (N + 1) * 8 bytes: offset of the first out-neighbor of each node, followed by M
 * - M * 4 bytes: out-neighbors
 *
 * All integers are stored in little-endian byte order.
 *
 * @file:   bin_graph.h
 * @date:   07.03.2026
 ******************************************************************************/
#pragma once

#include <cstdint>
#include <string>

#include "bigap/datastructures/graph.h"

namespace bigap::io::bin {

constexpr std::uint64_t kFingerprint = (sizeof(std::uint64_t) << 4) | sizeof(std::uint32_t);

/*!
 * Reads a graph in bin format. Every read is bounds checked.
 *
 * @param filename Name of the file to read.
 * @return The graph stored in the file.
 *
 * @throws LoadError if the file is truncated, has a wrong fingerprint or stores a malformed graph.
 */
[[nodiscard]] Graph read(const std::string &filename);

/*!
 * Writes a graph in bin format.
 *
 * @throws IOError if the file cannot be written, LoadError if the graph does not fit the format.
 */
void write(const std::string &filename, const Graph &graph);

} // namespace bigap::io::bin
