/*******************************************************************************
 * Tokener that transforms a memory-mapped text file into tokens.
 *
 * @file:   file_toker.h
 * @date:   07.03.2026
 ******************************************************************************/
#pragma once

#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "bigap-common/errors.h"

namespace bigap::io {

/*!
 * Read-only view of a text file mapped into memory. Every scan checks the current symbol and
 * throws a `LoadError` naming the line on unexpected input.
 */
class MappedFileToker {
public:
  explicit MappedFileToker(const std::string &filename) {
    _fd = open(filename.c_str(), O_RDONLY);
    if (_fd == -1) {
      throw LoadError("cannot open input file " + filename);
    }

    struct stat file_info{};
    if (fstat(_fd, &file_info) == -1) {
      close(_fd);
      throw LoadError("cannot get status of input file " + filename);
    }

    _position = 0;
    _length = static_cast<std::size_t>(file_info.st_size);

    // Empty files cannot be mapped
    if (_length == 0) {
      return;
    }

    _contents = static_cast<char *>(mmap(nullptr, _length, PROT_READ, MAP_PRIVATE, _fd, 0));
    if (_contents == MAP_FAILED) {
      close(_fd);
      throw LoadError("cannot map input file " + filename + " into memory");
    }
  }

  MappedFileToker(const MappedFileToker &) = delete;
  MappedFileToker &operator=(const MappedFileToker &) = delete;

  ~MappedFileToker() {
    if (_length > 0) {
      munmap(_contents, _length);
    }
    close(_fd);
  }

  inline void skip_spaces() {
    while (valid_position() && (current() == ' ' || current() == '\t' || current() == '\r')) {
      advance();
    }
  }

  inline void skip_line() {
    while (valid_position() && current() != '\n') {
      advance();
    }

    if (valid_position()) {
      advance();
    }
  }

  inline std::uint64_t scan_uint() {
    if (!valid_position() || !std::isdigit(current())) {
      fail("expected an unsigned integer");
    }

    std::uint64_t number = 0;
    while (valid_position() && std::isdigit(current())) {
      const std::uint64_t digit = current() - '0';
      if (number > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
        fail("integer does not fit into 64 bits");
      }
      number = number * 10 + digit;
      advance();
    }

    skip_spaces();
    return number;
  }

  inline void consume_char(const char ch) {
    if (!valid_position() || current() != ch) {
      std::stringstream ss;
      ss << "unexpected symbol, expected '" << (ch == '\n' ? std::string("\\n") : std::string(1, ch))
         << "'";
      fail(ss.str());
    }

    if (ch == '\n') {
      ++_line;
    }
    advance();
  }

  //! Skips lines starting with `%` and, if requested, empty lines.
  inline void skip_comments(const bool skip_empty_lines = true) {
    skip_spaces();
    while (valid_position() && (current() == '%' || (skip_empty_lines && current() == '\n'))) {
      skip_line();
      ++_line;
      skip_spaces();
    }
  }

  [[noreturn]] void fail(const std::string &what) const {
    std::stringstream ss;
    ss << "line " << _line << ": " << what;
    throw LoadError(ss.str());
  }

  [[nodiscard]] inline bool valid_position() const {
    return _position < _length;
  }

  [[nodiscard]] inline char current() const {
    return _contents[_position];
  }

  [[nodiscard]] inline bool at_line_end() const {
    return !valid_position() || current() == '\n';
  }

  inline void advance() {
    ++_position;
  }

  [[nodiscard]] inline std::size_t position() const {
    return _position;
  }

  [[nodiscard]] inline std::size_t length() const {
    return _length;
  }

private:
  int _fd;
  std::size_t _position;
  std::size_t _length;
  std::size_t _line = 1;
  char *_contents = nullptr;
};

} // namespace bigap::io
