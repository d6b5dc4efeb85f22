/*******************************************************************************
 * IO utilities for the standalone binary.
 *
 * @file:   graph_io.h
 * @date:   07.03.2026
 ******************************************************************************/
#pragma once

#include <span>
#include <string>
#include <unordered_map>

#include "bigap/bigap.h"
#include "bigap/datastructures/graph.h"

namespace bigap::io {

/*!
 * All graph file formats that can be parsed.
 */
enum class GraphFileFormat {
  BIN,
  METIS,
};

/*!
 * Returns a table that maps identifiers to their corresponding graph file format.
 *
 * @return A table that maps identifiers to their corresponding graph file format.
 */
[[nodiscard]] std::unordered_map<std::string, GraphFileFormat> get_graph_file_formats();

/*!
 * Reads a graph that is stored in bin or METIS format.
 *
 * @param filename The name of the file to read.
 * @param file_format The format of the file used to store the graph.
 * @return The graph that is stored in the file.
 */
[[nodiscard]] Graph read(const std::string &filename, GraphFileFormat file_format);

namespace permutation {

enum class OutputFormat {
  //! N unsigned 64 bit integers, most significant byte first.
  BINARY,
  //! One new ID per line.
  TEXT,
};

[[nodiscard]] std::unordered_map<std::string, OutputFormat> get_output_formats();

/*!
 * Writes the permutation `permutation[old_id] = new_id`. Missing parent directories of the output
 * file are created.
 *
 * @throws IOError if the file cannot be created or written.
 */
void write(const std::string &filename, std::span<const NodeID> permutation, OutputFormat format);

} // namespace permutation

} // namespace bigap::io
