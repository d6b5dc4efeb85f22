/*******************************************************************************
 * Reader and writer for binary files.
 *
 * @file:   binary_util.h
 * @date:   07.03.2026
 ******************************************************************************/
#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "bigap-common/errors.h"

namespace bigap::io {

// Binary graphs are stored in little-endian byte order and read without conversion
static_assert(std::endian::native == std::endian::little);

class BinaryReader {
public:
  explicit BinaryReader(const std::string &filename) : _filename(filename) {
    _file = open(filename.c_str(), O_RDONLY);
    if (_file == -1) {
      throw LoadError("cannot open file " + filename);
    }

    struct stat file_info{};
    if (fstat(_file, &file_info) == -1) {
      close(_file);
      throw LoadError("cannot determine the size of file " + filename);
    }

    _length = static_cast<std::size_t>(file_info.st_size);
    if (_length == 0) {
      return;
    }

    _data = static_cast<std::uint8_t *>(mmap(nullptr, _length, PROT_READ, MAP_PRIVATE, _file, 0));
    if (_data == MAP_FAILED) {
      close(_file);
      throw LoadError("cannot map file " + filename);
    }
  }

  BinaryReader(const BinaryReader &) = delete;
  BinaryReader &operator=(const BinaryReader &) = delete;

  ~BinaryReader() {
    if (_length > 0) {
      munmap(_data, _length);
    }
    close(_file);
  }

  //! Throws a `LoadError` if the file ends before `position + num_bytes`.
  void require(const std::size_t position, const std::size_t num_bytes, const char *what) const {
    if (position > _length || num_bytes > _length - position) {
      std::stringstream ss;
      ss << _filename << " is truncated: cannot read " << what << " (" << num_bytes
         << " bytes at offset " << position << ", but the file has only " << _length
         << " bytes)";
      throw LoadError(ss.str());
    }
  }

  template <typename T> [[nodiscard]] T read(const std::size_t position) const {
    T value;
    std::memcpy(&value, _data + position, sizeof(T));
    return value;
  }

  [[nodiscard]] std::size_t length() const {
    return _length;
  }

private:
  std::string _filename;
  int _file;
  std::size_t _length;
  std::uint8_t *_data = nullptr;
};

class BinaryWriter {
public:
  explicit BinaryWriter(const std::string &filename)
      : _filename(filename),
        _out(filename, std::ios::binary | std::ios::trunc) {
    if (!_out) {
      throw IOError("cannot create file " + filename);
    }
  }

  void write(const char *data, const std::size_t size) {
    _out.write(data, static_cast<std::streamsize>(size));
  }

  template <typename T> void write_int(const T value) {
    _out.write(reinterpret_cast<const char *>(&value), sizeof(T));
  }

  //! Writes `value` with the most significant byte first.
  void write_uint64_be(const std::uint64_t value) {
    char bytes[sizeof(std::uint64_t)];
    for (std::size_t i = 0; i < sizeof(std::uint64_t); ++i) {
      bytes[i] = static_cast<char>((value >> (8 * (sizeof(std::uint64_t) - 1 - i))) & 0xFF);
    }
    write(bytes, sizeof(bytes));
  }

  //! Flushes the file and throws an `IOError` if any write failed.
  void close() {
    _out.flush();
    if (!_out) {
      throw IOError("cannot write to file " + _filename);
    }
    _out.close();
  }

private:
  std::string _filename;
  std::ofstream _out;
};

} // namespace bigap::io
