/*******************************************************************************
 * Cost models for the gap-encoding cost of a neighbor during a bisection.
 *
 * @file:   gain_models.h
 * @date:   03.03.2026
 ******************************************************************************/
#pragma once

#include <string_view>

#include "bigap/bigap.h"

#include "bigap-common/math.h"

namespace bigap {

//
// log2 implementations; each one is the strategy behind one GainModel
//

struct ExactLog2 {
  static constexpr GainModel kModel = GainModel::DEFAULT;
  static constexpr std::string_view kName = "default";

  static float log2(const NodeID x) {
    return math::log2(x);
  }
};

struct FastLog2 {
  static constexpr GainModel kModel = GainModel::APPROX_1;
  static constexpr std::string_view kName = "approx-1";

  static float log2(const NodeID x) {
    return math::fast_log2(static_cast<float>(x));
  }
};

struct FasterLog2 {
  static constexpr GainModel kModel = GainModel::APPROX_2;
  static constexpr std::string_view kName = "approx-2";

  static float log2(const NodeID x) {
    return math::faster_log2(static_cast<float>(x));
  }
};

/*!
 * Estimates the number of bits needed to gap-encode the list of a neighbor `v` after the
 * bisection, given the side degrees `(d1, d2)` of `v`: `d1` nodes of the left half (with `n1`
 * nodes) and `d2` nodes of the right half (with `n2` nodes) link to `v`. The cost is
 *
 *   d1 * (log2 n1 - log2(d1 + 1)) + d2 * (log2 n2 - log2(d2 + 1)).
 *
 * The model is stateless except for the precomputed logarithms of the half sizes.
 */
template <typename Log2> class LogGapCostModel {
public:
  using Log2Function = Log2;

  LogGapCostModel(const NodeID n1, const NodeID n2)
      : _log2_n1(Log2::log2(n1)),
        _log2_n2(Log2::log2(n2)) {}

  [[nodiscard]] Gain cost(const NodeID d1, const NodeID d2) const {
    Gain cost = 0.0f;
    if (d1 > 0) {
      cost += static_cast<Gain>(d1) * (_log2_n1 - Log2::log2(d1 + 1));
    }
    if (d2 > 0) {
      cost += static_cast<Gain>(d2) * (_log2_n2 - Log2::log2(d2 + 1));
    }
    return cost;
  }

  //! Cost of the neighbor after one node that links to it moved from the left to the right half.
  [[nodiscard]] Gain cost_left_to_right(const NodeID d1, const NodeID d2) const {
    return d1 > 0 ? cost(d1 - 1, d2 + 1) : 0.0f;
  }

  //! Cost of the neighbor after one node that links to it moved from the right to the left half.
  [[nodiscard]] Gain cost_right_to_left(const NodeID d1, const NodeID d2) const {
    return d2 > 0 ? cost(d1 + 1, d2 - 1) : 0.0f;
  }

private:
  Gain _log2_n1;
  Gain _log2_n2;
};

using DefaultCostModel = LogGapCostModel<ExactLog2>;
using Approx1CostModel = LogGapCostModel<FastLog2>;
using Approx2CostModel = LogGapCostModel<FasterLog2>;

} // namespace bigap
