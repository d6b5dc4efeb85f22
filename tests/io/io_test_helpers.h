#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gmock/gmock.h>

namespace bigap::testing {
//! Path of a file in a fresh scratch directory of the current test.
inline std::string scratch_file(const std::string &name) {
  const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
  const std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / "bigap" /
                                    info->test_suite_name() / info->name();
  std::filesystem::create_directories(dir);

  const std::filesystem::path path = dir / name;
  std::filesystem::remove_all(path);
  return path.string();
}

inline void write_text_file(const std::string &filename, const std::string &contents) {
  std::ofstream out(filename, std::ios::trunc);
  out << contents;
}

inline std::vector<std::uint8_t> read_bytes(const std::string &filename) {
  std::ifstream in(filename, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline std::string read_text_file(const std::string &filename) {
  std::ifstream in(filename);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

//! Appends integers in native (little-endian) byte order.
class ByteBuffer {
public:
  template <typename T> ByteBuffer &append(const T value) {
    const auto *bytes = reinterpret_cast<const char *>(&value);
    _bytes.insert(_bytes.end(), bytes, bytes + sizeof(T));
    return *this;
  }

  void write_to(const std::string &filename) const {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    out.write(_bytes.data(), static_cast<std::streamsize>(_bytes.size()));
  }

private:
  std::vector<char> _bytes;
};
} // namespace bigap::testing
