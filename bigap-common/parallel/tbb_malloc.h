/*******************************************************************************
 * Memory allocation through TBB's scalable allocator.
 *
 * @file:   tbb_malloc.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <new>

#include <tbb/scalable_allocator.h>

namespace bigap::parallel {

template <typename T> struct tbb_deleter {
  void operator()(T *p) const {
    scalable_free(p);
  }
};

template <typename T> using tbb_unique_ptr = std::unique_ptr<T, tbb_deleter<T>>;

//! Allocates uninitialized memory for `size` elements of type T.
//! Throws std::bad_alloc if the allocator cannot satisfy the request.
template <typename T> tbb_unique_ptr<T> make_unique(const std::size_t size) {
  if (size == 0) {
    return tbb_unique_ptr<T>(nullptr, tbb_deleter<T>{});
  }

  if (size > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
    throw std::bad_alloc();
  }

  T *ptr = static_cast<T *>(scalable_malloc(sizeof(T) * size));
  if (ptr == nullptr) {
    throw std::bad_alloc();
  }

  return tbb_unique_ptr<T>(ptr, tbb_deleter<T>{});
}

} // namespace bigap::parallel
