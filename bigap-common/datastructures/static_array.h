/*******************************************************************************
 * Fixed-size array allocated through TBB's scalable allocator.
 *
 * @file:   static_array.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <span>
#include <type_traits>
#include <vector>

#include <tbb/parallel_for.h>

#include "bigap-common/assert.h"
#include "bigap-common/parallel/tbb_malloc.h"

namespace bigap {
namespace static_array {
//! Tag for allocating memory without touching it. Without this tag, memory is initialized with
//! the default value of the element type.
constexpr struct noinit_t {
} noinit;

//! Tag for initializing memory sequentially. Without this tag, memory is initialized by a
//! parallel loop. Has no effect in combination with the noinit tag.
constexpr struct seq_t {
} seq;

template <typename Tag, typename... Tags>
constexpr bool contains_tag_v = (std::is_same_v<Tag, std::decay_t<Tags>> || ...);

template <typename T>
concept AllocationTag = std::is_same_v<T, noinit_t> || std::is_same_v<T, seq_t>;

//! Arrays below this size are always initialized sequentially.
constexpr std::size_t kParallelInitThreshold = 1 << 14;
} // namespace static_array

template <typename T> class StaticArray {
  static_assert(std::is_trivially_copyable_v<T>);

public:
  using value_type = T;
  using size_type = std::size_t;
  using reference = T &;
  using const_reference = const T &;
  using iterator = T *;
  using const_iterator = const T *;

  StaticArray() = default;

  template <static_array::AllocationTag... Tags>
  explicit StaticArray(const std::size_t size, Tags... tags) {
    resize(size, value_type(), tags...);
  }

  template <static_array::AllocationTag... Tags>
  StaticArray(const std::size_t size, const value_type init_value, Tags... tags) {
    resize(size, init_value, tags...);
  }

  template <std::random_access_iterator Iterator>
  StaticArray(Iterator first, Iterator last)
      : StaticArray(static_cast<std::size_t>(std::distance(first, last)), static_array::noinit) {
    tbb::parallel_for<std::size_t>(0, _size, [&](const std::size_t i) { _data[i] = *(first + i); });
  }

  StaticArray(const StaticArray &) = delete;
  StaticArray &operator=(const StaticArray &) = delete;

  StaticArray(StaticArray &&other) noexcept
      : _size(other._size),
        _owned_data(std::move(other._owned_data)),
        _data(other._data) {
    other._size = 0;
    other._data = nullptr;
  }

  StaticArray &operator=(StaticArray &&other) noexcept {
    if (this != &other) {
      _size = other._size;
      _owned_data = std::move(other._owned_data);
      _data = other._data;
      other._size = 0;
      other._data = nullptr;
    }
    return *this;
  }

  //
  // Data access
  //

  reference operator[](const size_type pos) {
    KASSERT(pos < _size, "out of bounds access: " << pos << " >= " << _size, assert::heavy);
    return _data[pos];
  }

  const_reference operator[](const size_type pos) const {
    KASSERT(pos < _size, "out of bounds access: " << pos << " >= " << _size, assert::heavy);
    return _data[pos];
  }

  reference back() {
    KASSERT(_size > 0u);
    return _data[_size - 1];
  }

  const_reference back() const {
    KASSERT(_size > 0u);
    return _data[_size - 1];
  }

  reference front() {
    KASSERT(_size > 0u);
    return _data[0];
  }

  const_reference front() const {
    KASSERT(_size > 0u);
    return _data[0];
  }

  value_type *data() {
    return _data;
  }

  const value_type *data() const {
    return _data;
  }

  operator std::span<T>() {
    return {_data, _size};
  }

  operator std::span<const T>() const {
    return {_data, _size};
  }

  //
  // Iterators
  //

  iterator begin() {
    return _data;
  }

  const_iterator begin() const {
    return _data;
  }

  iterator end() {
    return _data + _size;
  }

  const_iterator end() const {
    return _data + _size;
  }

  //
  // Capacity
  //

  [[nodiscard]] bool empty() const {
    return _size == 0;
  }

  [[nodiscard]] size_type size() const {
    return _size;
  }

  template <static_array::AllocationTag... Tags>
  void resize(const std::size_t size, Tags... tags) {
    resize(size, value_type(), tags...);
  }

  template <static_array::AllocationTag... Tags>
  void resize(const std::size_t size, const value_type init_value, Tags...) {
    // Free the old memory first so that both allocations are never alive at the same time
    _owned_data.reset();
    _owned_data = parallel::make_unique<value_type>(size);
    _data = _owned_data.get();
    _size = size;

    if constexpr (!static_array::contains_tag_v<static_array::noinit_t, Tags...>) {
      assign(size, init_value, !static_array::contains_tag_v<static_array::seq_t, Tags...>);
    }
  }

  void assign(const size_type count, const value_type value, const bool assign_parallel = true) {
    KASSERT(count <= _size);

    if (assign_parallel && count >= static_array::kParallelInitThreshold) {
      tbb::parallel_for(tbb::blocked_range<size_type>(0, count), [&](const auto &r) {
        std::fill(_data + r.begin(), _data + r.end(), value);
      });
    } else {
      std::fill(_data, _data + count, value);
    }
  }

  void free() {
    _size = 0;
    _data = nullptr;
    _owned_data.reset();
  }

private:
  size_type _size = 0;
  parallel::tbb_unique_ptr<value_type> _owned_data = nullptr;
  value_type *_data = nullptr;
};

namespace static_array {
template <typename T> StaticArray<T> create(std::initializer_list<T> list) {
  return {list.begin(), list.end()};
}

template <typename T> StaticArray<T> create(const std::vector<T> &vec) {
  return {vec.begin(), vec.end()};
}
} // namespace static_array
} // namespace bigap
