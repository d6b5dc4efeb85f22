/*******************************************************************************
 * Exception types thrown by the graph readers and the reordering pipeline.
 *
 * @file:   errors.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <stdexcept>
#include <string>

namespace bigap {

//! Thrown if an input graph is malformed: truncated data, a wrong fingerprint, non-monotone
//! offsets or a neighbor ID outside of [0, n).
class LoadError : public std::runtime_error {
public:
  explicit LoadError(const std::string &what) : std::runtime_error(what) {}
};

//! Thrown if an output file cannot be created or written.
class IOError : public std::runtime_error {
public:
  explicit IOError(const std::string &what) : std::runtime_error(what) {}
};

//! Thrown if the reordering pipeline detects a violated invariant, e.g., an unbalanced split or
//! a position range that is claimed twice. The message names the broken invariant.
class InternalError : public std::logic_error {
public:
  explicit InternalError(const std::string &what) : std::logic_error(what) {}
};

} // namespace bigap
