/*******************************************************************************
 * Scratch state of one bisection: sides, side degrees, cached costs and gains.
 *
 * @file:   gain_table.cc
 * @date:   04.03.2026
 ******************************************************************************/
#include "bigap/bisection/gain_table.h"

#include <algorithm>
#include <atomic>
#include <numeric>

#include <tbb/parallel_sort.h>

namespace bigap {
namespace {
template <typename Lambda> void pfor(const NodeID n, const bool parallel, Lambda &&l) {
  if (parallel) {
    tbb::parallel_for<NodeID>(0, n, std::forward<Lambda>(l));
  } else {
    for (NodeID i = 0; i < n; ++i) {
      l(i);
    }
  }
}
} // namespace

GainTable::GainTable(
    const Graph &graph, std::span<const NodeID> nodes, const NodeID num_left, const bool parallel
)
    : _parallel(parallel),
      _num_left(num_left),
      _ids(nodes.begin(), nodes.end()),
      _sides(nodes.size(), static_array::noinit),
      _gains(nodes.size()),
      _term_offsets(nodes.size() + 1) {
  const NodeID n = static_cast<NodeID>(nodes.size());
  KASSERT(num_left <= n);

  pfor(n, _parallel, [&](const NodeID i) { _sides[i] = (i < num_left) ? kLeft : kRight; });

  // Gather the neighbors of the subset
  StaticArray<EdgeID> raw_offsets(n + 1);
  for (NodeID i = 0; i < n; ++i) {
    raw_offsets[i + 1] = raw_offsets[i] + graph.degree(nodes[i]);
  }

  const EdgeID num_raw_terms = raw_offsets[n];
  StaticArray<NodeID> raw_terms(num_raw_terms, static_array::noinit);
  pfor(n, _parallel, [&](const NodeID i) {
    const auto neighbors = graph.neighbors(nodes[i]);
    std::copy(neighbors.begin(), neighbors.end(), raw_terms.begin() + raw_offsets[i]);
  });

  // Map the neighbors to dense local IDs
  StaticArray<NodeID> distinct(raw_terms.begin(), raw_terms.end());
  if (_parallel) {
    tbb::parallel_sort(distinct.begin(), distinct.end());
  } else {
    std::sort(distinct.begin(), distinct.end());
  }
  const auto distinct_end = std::unique(distinct.begin(), distinct.end());
  const NodeID num_terms = static_cast<NodeID>(distinct_end - distinct.begin());

  StaticArray<NodeID> unique_degrees(n, static_array::noinit);
  pfor(n, _parallel, [&](const NodeID i) {
    auto *first = raw_terms.begin() + raw_offsets[i];
    auto *last = raw_terms.begin() + raw_offsets[i + 1];

    for (auto *it = first; it != last; ++it) {
      const auto pos = std::lower_bound(distinct.begin(), distinct_end, *it);
      *it = static_cast<NodeID>(pos - distinct.begin());
    }

    std::sort(first, last);
    unique_degrees[i] = static_cast<NodeID>(std::unique(first, last) - first);
  });
  distinct.free();

  // Compact the deduplicated adjacency lists
  for (NodeID i = 0; i < n; ++i) {
    _term_offsets[i + 1] = _term_offsets[i] + unique_degrees[i];
  }

  _terms.resize(_term_offsets[n], static_array::noinit);
  pfor(n, _parallel, [&](const NodeID i) {
    std::copy_n(
        raw_terms.begin() + raw_offsets[i], unique_degrees[i], _terms.begin() + _term_offsets[i]
    );
  });
  raw_terms.free();

  // Side degrees
  _left_degrees.resize(num_terms);
  _right_degrees.resize(num_terms);
  pfor(n, _parallel, [&](const NodeID i) {
    auto &degrees = (_sides[i] == kLeft) ? _left_degrees : _right_degrees;
    for (const NodeID t : terms(i)) {
      std::atomic_ref<NodeID>(degrees[t]).fetch_add(1, std::memory_order_relaxed);
    }
  });

  _costs.resize(num_terms, static_array::noinit);
  _costs_left_to_right.resize(num_terms, static_array::noinit);
  _costs_right_to_left.resize(num_terms, static_array::noinit);
}

void GainTable::compute_gains() {
  pfor(n(), _parallel, [&](const NodeID i) {
    const auto &costs_after = (_sides[i] == kLeft) ? _costs_left_to_right : _costs_right_to_left;

    Gain gain = 0.0f;
    for (const NodeID t : terms(i)) {
      gain += _costs[t] - costs_after[t];
    }
    _gains[i] = gain;
  });
}

Gain GainTable::swap_gain(const NodeID a, const NodeID b) const {
  KASSERT(_sides[a] == kLeft && _sides[b] == kRight, "", assert::light);

  Gain gain = 0.0f;
  for_each_exclusive_term(
      a,
      b,
      [&](const NodeID t) { gain += _costs[t] - _costs_left_to_right[t]; },
      [&](const NodeID t) { gain += _costs[t] - _costs_right_to_left[t]; }
  );
  return gain;
}

double GainTable::total_cost() const {
  return std::accumulate(_costs.begin(), _costs.end(), 0.0);
}

void GainTable::write_back(std::span<NodeID> nodes) const {
  KASSERT(nodes.size() == n());

  auto left = nodes.begin();
  auto right = nodes.begin() + count(kLeft);
  for (NodeID i = 0; i < n(); ++i) {
    if (_sides[i] == kLeft) {
      *left++ = _ids[i];
    } else {
      *right++ = _ids[i];
    }
  }
}

NodeID GainTable::count(const Side side) const {
  return static_cast<NodeID>(std::count(_sides.begin(), _sides.end(), side));
}

} // namespace bigap
