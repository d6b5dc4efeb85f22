/*******************************************************************************
 * Utility functions for common computations.
 *
 * @file:   math.h
 * @date:   03.03.2026
 ******************************************************************************/
#pragma once

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>
#include <utility>

namespace bigap::math {

//! Splits `value` into two parts whose sizes differ by at most one, with the larger part first.
template <typename T> constexpr std::pair<T, T> split_balanced(const T value) {
  return {value - value / 2, value / 2};
}

namespace detail {
constexpr std::size_t kLog2TableSize = 1 << 12;

inline const std::array<float, kLog2TableSize> &log2_table() {
  static const std::array<float, kLog2TableSize> table = [] {
    std::array<float, kLog2TableSize> table{};
    table[0] = 0.0f;
    for (std::size_t i = 1; i < kLog2TableSize; ++i) {
      table[i] = std::log2(static_cast<float>(i));
    }
    return table;
  }();
  return table;
}
} // namespace detail

//! Exact binary logarithm. Small arguments are answered from a precomputed table.
//! Returns 0 for `x = 0`.
template <typename Int> float log2(const Int x) {
  if (static_cast<std::size_t>(x) < detail::kLog2TableSize) {
    return detail::log2_table()[x];
  }
  return std::log2(static_cast<float>(x));
}

//! Approximation of the binary logarithm of a positive float: the exponent is read from the
//! IEEE-754 representation and the mantissa is corrected by a rational function. Absolute error
//! is below 1e-4.
inline float fast_log2(const float x) {
  const std::uint32_t bits = std::bit_cast<std::uint32_t>(x);
  const float mantissa = std::bit_cast<float>((bits & 0x007FFFFFu) | 0x3F000000u);
  const float y = static_cast<float>(bits) * 1.1920928955078125e-7f;

  return y - 124.22551499f - 1.498030302f * mantissa - 1.72587999f / (0.3520887068f + mantissa);
}

//! Coarser approximation of the binary logarithm of a positive float: exponent plus the
//! mantissa bits interpreted linearly. Absolute error is below 0.09.
inline float faster_log2(const float x) {
  const std::uint32_t bits = std::bit_cast<std::uint32_t>(x);
  return static_cast<float>(bits) * 1.1920928955078125e-7f - 126.94269504f;
}

} // namespace bigap::math
