/*******************************************************************************
 * Public library interface of BiGap.
 *
 * @file:   bigap.cc
 * @date:   06.03.2026
 ******************************************************************************/
#include "bigap/bigap.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "bigap/bisection/partitioner.h"
#include "bigap/context_io.h"
#include "bigap/datastructures/graph.h"
#include "bigap/factories.h"
#include "bigap/metrics.h"

#include "bigap-common/console_io.h"
#include "bigap-common/errors.h"
#include "bigap-common/logger.h"
#include "bigap-common/timer.h"

namespace bigap {

namespace {

std::string format_cost(const double bits, const EdgeID m) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(0) << bits << " bits (" << std::setprecision(3)
     << (m > 0 ? bits / m : 0.0) << " bits/edge)";
  return ss.str();
}

void print_statistics(
    const Graph &graph,
    const BisectionStatistics &stats,
    const double cost_before,
    const double cost_after,
    const int max_timer_depth,
    const bool parseable
) {
  cio::print_delimiter("Result Summary");

  // Statistics output that is easy to parse
  if (parseable) {
    LOG << "RESULT cost_before=" << cost_before << " cost_after=" << cost_after
        << " bisections=" << stats.num_bisections << " leaves=" << stats.num_leaves
        << " swaps=" << stats.num_swaps << " unconverged=" << stats.num_unconverged;
#ifdef BIGAP_ENABLE_TIMERS
    LLOG << "TIME ";
    Timer::global().print_machine_readable(std::cout);
#else  // BIGAP_ENABLE_TIMERS
    LOG << "TIME disabled";
#endif // BIGAP_ENABLE_TIMERS
    LOG;
  }

#ifdef BIGAP_ENABLE_TIMERS
  Timer::global().print_human_readable(std::cout, max_timer_depth);
#else  // BIGAP_ENABLE_TIMERS
  ((void)max_timer_depth);
  LOG << "Global Timers: disabled";
#endif // BIGAP_ENABLE_TIMERS
  LOG;

  LOG << "Recursion summary:";
  LOG << "  Bisections:            " << stats.num_bisections;
  LOG << "  Leaves:                " << stats.num_leaves;
  LOG << "  Max depth:             " << stats.max_depth;
  LOG << "  Parallel tasks:        " << stats.num_parallel_tasks;
  LOG << "  Local search rounds:   " << stats.num_rounds;
  LOG << "  Swaps:                 " << stats.num_swaps;
  if (stats.num_unconverged > 0) {
    LOG << logger::ORANGE << "  Unconverged bisections: " << stats.num_unconverged;
  } else {
    LOG << "  Unconverged bisections: 0";
  }

  LOG;
  LOG << "Estimated log-gap cost:";
  LOG << "  Before:                " << format_cost(cost_before, graph.m());
  if (cost_after <= cost_before) {
    LOG << logger::GREEN << "  After:                 " << format_cost(cost_after, graph.m());
  } else {
    LOG << logger::ORANGE << "  After:                 " << format_cost(cost_after, graph.m());
  }
}

} // namespace

BiGap::BiGap() : BiGap(tbb::this_task_arena::max_concurrency(), create_default_context()) {}

BiGap::BiGap(const int num_threads, Context ctx)
    : _num_threads(num_threads),
      _ctx(std::move(ctx)),
      _gc(tbb::global_control::max_allowed_parallelism, num_threads) {
#ifdef BIGAP_ENABLE_TIMERS
  GLOBAL_TIMER.reset();
#endif // BIGAP_ENABLE_TIMERS
}

BiGap::~BiGap() = default;

void BiGap::set_output_level(const OutputLevel output_level) {
  _output_level = output_level;
}

void BiGap::set_max_timer_depth(const int max_timer_depth) {
  _max_timer_depth = max_timer_depth;
}

Context &BiGap::context() {
  return _ctx;
}

void BiGap::copy_graph(std::span<const EdgeID> xadj, std::span<const NodeID> adjncy) {
  SCOPED_TIMER("IO");

  if (xadj.empty()) {
    set_graph(Graph());
    return;
  }

  const NodeID n = static_cast<NodeID>(xadj.size() - 1);
  const EdgeID m = adjncy.size();

  StaticArray<EdgeID> nodes(n + 1, static_array::noinit);
  StaticArray<NodeID> edges(m, static_array::noinit);

  tbb::parallel_for<std::size_t>(0, xadj.size(), [&](const std::size_t u) {
    nodes[u] = xadj[u];
  });
  tbb::parallel_for<EdgeID>(0, m, [&](const EdgeID e) { edges[e] = adjncy[e]; });

  Graph graph(std::move(nodes), std::move(edges));
  graph.validate();

  set_graph(std::move(graph));
}

void BiGap::set_graph(Graph graph) {
  _graph_ptr = std::make_unique<Graph>(std::move(graph));
}

Graph BiGap::take_graph() {
  if (_graph_ptr == nullptr) {
    throw std::invalid_argument("Call BiGap::copy_graph() or BiGap::set_graph() first.");
  }

  Graph graph = std::move(*_graph_ptr);
  _graph_ptr.reset();
  return graph;
}

const Graph *BiGap::graph() {
  return _graph_ptr.get();
}

double BiGap::compute_permutation(std::span<NodeID> permutation) {
  if (_graph_ptr == nullptr) {
    throw std::invalid_argument(
        "Call BiGap::copy_graph() or BiGap::set_graph() before calling "
        "BiGap::compute_permutation()."
    );
  }
  if (permutation.size() != _graph_ptr->n()) {
    throw std::invalid_argument(
        "Length of the span passed to BiGap::compute_permutation() does not match the number of "
        "nodes of the graph."
    );
  }

  Logger::set_quiet_mode(_output_level == OutputLevel::QUIET);

  cio::print_bigap_banner();
  cio::print_build_identifier();
  cio::print_build_datatypes<NodeID, EdgeID>();
  cio::print_delimiter("Input Summary", '#');

  _ctx.parallel.num_threads = _num_threads;

  if (_output_level >= OutputLevel::APPLICATION) {
    LOG << "Number of nodes:              " << _graph_ptr->n();
    LOG << "Number of edges:              " << _graph_ptr->m();
    LOG << "Max out-degree:               " << _graph_ptr->max_degree();
    print(_ctx, std::cout);
  }

  const bool print_summary = _output_level >= OutputLevel::APPLICATION;
  const double cost_before = print_summary ? metrics::log_gap_cost(*_graph_ptr) : 0.0;

  START_TIMER("Reordering");
  auto partitioner = factory::create_partitioner(*_graph_ptr, _ctx);
  StaticArray<NodeID> result = partitioner->compute_permutation();
  const BisectionStatistics stats = partitioner->statistics();
  partitioner.reset();
  STOP_TIMER();

  if (_ctx.debug.validate_permutation && !metrics::is_permutation(result)) {
    throw InternalError("computed node order is not a permutation of the nodes");
  }

  START_TIMER("IO");
  tbb::parallel_for<NodeID>(0, _graph_ptr->n(), [&](const NodeID u) {
    permutation[u] = result[u];
  });
  STOP_TIMER();

  const double cost_after = metrics::log_gap_cost(*_graph_ptr, permutation);

  if (print_summary) {
    print_statistics(
        *_graph_ptr,
        stats,
        cost_before,
        cost_after,
        _max_timer_depth,
        _output_level >= OutputLevel::EXPERIMENT
    );
  }

#ifdef BIGAP_ENABLE_TIMERS
  GLOBAL_TIMER.reset();
#endif // BIGAP_ENABLE_TIMERS

  return cost_after;
}

std::vector<NodeID> BiGap::compute_permutation() {
  if (_graph_ptr == nullptr) {
    throw std::invalid_argument(
        "Call BiGap::copy_graph() or BiGap::set_graph() before calling "
        "BiGap::compute_permutation()."
    );
  }

  std::vector<NodeID> permutation(_graph_ptr->n());
  compute_permutation(permutation);
  return permutation;
}

} // namespace bigap
