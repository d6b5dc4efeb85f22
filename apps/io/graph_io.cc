/*******************************************************************************
 * IO utilities for the standalone binary.
 *
 * @file:   graph_io.cc
 * @date:   07.03.2026
 ******************************************************************************/
#include "apps/io/graph_io.h"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "bigap-common/errors.h"
#include "bigap-common/timer.h"

#include "apps/io/bin_graph.h"
#include "apps/io/binary_util.h"
#include "apps/io/metis_parser.h"

namespace bigap::io {

std::unordered_map<std::string, GraphFileFormat> get_graph_file_formats() {
  return {
      {"bin", GraphFileFormat::BIN},
      {"metis", GraphFileFormat::METIS},
  };
}

Graph read(const std::string &filename, const GraphFileFormat file_format) {
  switch (file_format) {
  case GraphFileFormat::BIN:
    return bin::read(filename);

  case GraphFileFormat::METIS:
    return metis::read(filename);
  }

  __builtin_unreachable();
}

namespace permutation {

namespace {
void create_parent_directory(const std::string &filename) {
  const std::filesystem::path parent = std::filesystem::path(filename).parent_path();
  if (parent.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw IOError("cannot create directory " + parent.string() + ": " + ec.message());
  }
}

void write_binary(const std::string &filename, const std::span<const NodeID> permutation) {
  BinaryWriter writer(filename);
  for (const NodeID new_id : permutation) {
    writer.write_uint64_be(static_cast<std::uint64_t>(new_id));
  }
  writer.close();
}

void write_text(const std::string &filename, const std::span<const NodeID> permutation) {
  std::ofstream out(filename, std::ios::trunc);
  if (!out) {
    throw IOError("cannot create file " + filename);
  }

  for (const NodeID new_id : permutation) {
    out << new_id << "\n";
  }

  out.flush();
  if (!out) {
    throw IOError("cannot write to file " + filename);
  }
}
} // namespace

std::unordered_map<std::string, OutputFormat> get_output_formats() {
  return {
      {"binary", OutputFormat::BINARY},
      {"text", OutputFormat::TEXT},
  };
}

void write(
    const std::string &filename, const std::span<const NodeID> permutation, const OutputFormat format
) {
  SCOPED_TIMER("Write permutation");
  create_parent_directory(filename);

  switch (format) {
  case OutputFormat::BINARY:
    write_binary(filename, permutation);
    break;

  case OutputFormat::TEXT:
    write_text(filename, permutation);
    break;
  }
}

} // namespace permutation

} // namespace bigap::io
