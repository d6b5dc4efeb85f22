/*******************************************************************************
 * Scratch state of one bisection: sides, side degrees, cached costs and gains.
 *
 * @file:   gain_table.h
 * @date:   04.03.2026
 ******************************************************************************/
#pragma once

#include <cstdint>
#include <span>

#include <tbb/parallel_for.h>

#include "bigap/bigap.h"
#include "bigap/datastructures/graph.h"

#include "bigap-common/assert.h"
#include "bigap-common/datastructures/static_array.h"

namespace bigap {

/*!
 * Holds the state of one bisection of a node subset. Nodes are addressed by their local index
 * `i` in the subset, neighbors ("terms") by a dense local ID `t` in `[0, num_terms())`, so that
 * all arrays are sized by the subset instead of the whole graph.
 *
 * For each term, the table stores how many nodes of either side link to it (its side degrees)
 * and caches three costs computed by the cost model: the current cost of the term and its cost
 * after one linking node moved from left to right, resp. from right to left.
 */
class GainTable {
public:
  using Side = std::uint8_t;
  static constexpr Side kLeft = 0;
  static constexpr Side kRight = 1;

  /*!
   * Initializes the table for the given subset: the first `num_left` nodes form the left half,
   * the remaining nodes the right half. Duplicate neighbors in an adjacency list are counted
   * once.
   *
   * @param graph The graph that contains the subset.
   * @param nodes The subset, given by original node IDs.
   * @param num_left Number of nodes in the left half.
   * @param parallel Whether the table may use parallel loops.
   */
  GainTable(const Graph &graph, std::span<const NodeID> nodes, NodeID num_left, bool parallel);

  GainTable(const GainTable &) = delete;
  GainTable &operator=(const GainTable &) = delete;

  GainTable(GainTable &&) noexcept = default;
  GainTable &operator=(GainTable &&) noexcept = default;

  //
  // Size of the subset
  //

  [[nodiscard]] NodeID n() const {
    return static_cast<NodeID>(_ids.size());
  }

  [[nodiscard]] NodeID num_left() const {
    return _num_left;
  }

  [[nodiscard]] NodeID num_right() const {
    return n() - _num_left;
  }

  [[nodiscard]] NodeID num_terms() const {
    return static_cast<NodeID>(_left_degrees.size());
  }

  [[nodiscard]] bool parallel() const {
    return _parallel;
  }

  //
  // Nodes
  //

  //! Original ID of the node with local index `i`.
  [[nodiscard]] NodeID node(const NodeID i) const {
    return _ids[i];
  }

  [[nodiscard]] Side side(const NodeID i) const {
    return _sides[i];
  }

  //! Sorted local IDs of the distinct neighbors of the node with local index `i`.
  [[nodiscard]] std::span<const NodeID> terms(const NodeID i) const {
    return {_terms.data() + _term_offsets[i], _terms.data() + _term_offsets[i + 1]};
  }

  [[nodiscard]] Gain gain(const NodeID i) const {
    return _gains[i];
  }

  //
  // Terms
  //

  [[nodiscard]] NodeID left_degree(const NodeID t) const {
    return _left_degrees[t];
  }

  [[nodiscard]] NodeID right_degree(const NodeID t) const {
    return _right_degrees[t];
  }

  [[nodiscard]] Gain cost(const NodeID t) const {
    return _costs[t];
  }

  //
  // Cost and gain computation
  //

  //! Recomputes the cached costs of all terms.
  template <typename CostModel> void compute_costs(const CostModel &model) {
    const auto update = [&](const NodeID t) {
      update_costs(t, model);
    };

    if (_parallel) {
      tbb::parallel_for<NodeID>(0, num_terms(), update);
    } else {
      for (NodeID t = 0; t < num_terms(); ++t) {
        update(t);
      }
    }
  }

  //! Recomputes the move gain of every node from the cached term costs. The gain of a node is
  //! the reduction of the total cost if the node alone moved to the other side.
  void compute_gains();

  //! Exact reduction of the total cost if the nodes with local indices `a` (left) and `b`
  //! (right) exchange sides, given the current side degrees. Neighbors shared by both nodes keep
  //! their side degrees and contribute nothing.
  [[nodiscard]] Gain swap_gain(NodeID a, NodeID b) const;

  //! Exchanges the sides of `a` (left) and `b` (right) and updates the side degrees and cached
  //! costs of all affected terms. The cached node gains are not updated.
  template <typename CostModel> void swap(const NodeID a, const NodeID b, const CostModel &model) {
    KASSERT(_sides[a] == kLeft && _sides[b] == kRight, "", assert::light);

    for_each_exclusive_term(
        a,
        b,
        [&](const NodeID t) {
          --_left_degrees[t];
          ++_right_degrees[t];
          update_costs(t, model);
        },
        [&](const NodeID t) {
          ++_left_degrees[t];
          --_right_degrees[t];
          update_costs(t, model);
        }
    );

    _sides[a] = kRight;
    _sides[b] = kLeft;
  }

  //! Sum of the cached costs of all terms.
  [[nodiscard]] double total_cost() const;

  //! Writes the subset back in its new order: all nodes of the left side, then all nodes of the
  //! right side, each in the order in which they were given to the constructor.
  void write_back(std::span<NodeID> nodes) const;

  //! Number of nodes currently on the given side.
  [[nodiscard]] NodeID count(Side side) const;

private:
  template <typename CostModel> void update_costs(const NodeID t, const CostModel &model) {
    const NodeID d1 = _left_degrees[t];
    const NodeID d2 = _right_degrees[t];
    _costs[t] = model.cost(d1, d2);
    _costs_left_to_right[t] = model.cost_left_to_right(d1, d2);
    _costs_right_to_left[t] = model.cost_right_to_left(d1, d2);
  }

  // Invokes `only_a(t)` for all terms of `a` that are not terms of `b`, and `only_b(t)` for all
  // terms of `b` that are not terms of `a`
  template <typename OnlyA, typename OnlyB>
  void for_each_exclusive_term(const NodeID a, const NodeID b, OnlyA &&only_a, OnlyB &&only_b)
      const {
    const auto terms_a = terms(a);
    const auto terms_b = terms(b);

    auto it_a = terms_a.begin();
    auto it_b = terms_b.begin();
    while (it_a != terms_a.end() && it_b != terms_b.end()) {
      if (*it_a < *it_b) {
        only_a(*it_a++);
      } else if (*it_b < *it_a) {
        only_b(*it_b++);
      } else {
        ++it_a;
        ++it_b;
      }
    }
    for (; it_a != terms_a.end(); ++it_a) {
      only_a(*it_a);
    }
    for (; it_b != terms_b.end(); ++it_b) {
      only_b(*it_b);
    }
  }

  bool _parallel;
  NodeID _num_left;

  StaticArray<NodeID> _ids;
  StaticArray<Side> _sides;
  StaticArray<Gain> _gains;

  StaticArray<EdgeID> _term_offsets;
  StaticArray<NodeID> _terms;

  StaticArray<NodeID> _left_degrees;
  StaticArray<NodeID> _right_degrees;
  StaticArray<Gain> _costs;
  StaticArray<Gain> _costs_left_to_right;
  StaticArray<Gain> _costs_right_to_left;
};

} // namespace bigap
