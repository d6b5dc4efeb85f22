/*******************************************************************************
 * Public library interface of BiGap.
 *
 * @file:   bigap.h
 * @date:   03.03.2026
 ******************************************************************************/
#ifndef BIGAP_H
#define BIGAP_H

#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include <tbb/global_control.h>

#define BIGAP_VERSION_MAJOR 1
#define BIGAP_VERSION_MINOR 0
#define BIGAP_VERSION_PATCH 0

namespace bigap {

#ifdef BIGAP_64BIT_NODE_IDS
using NodeID = std::uint64_t;
#else  // BIGAP_64BIT_NODE_IDS
using NodeID = std::uint32_t;
#endif // BIGAP_64BIT_NODE_IDS

using EdgeID = std::uint64_t;

//! Move gains and estimated costs are measured in bits.
using Gain = float;

constexpr NodeID kInvalidNodeID = std::numeric_limits<NodeID>::max();
constexpr EdgeID kInvalidEdgeID = std::numeric_limits<EdgeID>::max();

//
// Bisection
//

//! Implementation of log2 used to estimate the gap-encoding cost of a neighbor.
enum class GainModel {
  DEFAULT,
  APPROX_1,
  APPROX_2,
};

//! Order of the nodes inside a leaf of the recursion tree.
enum class LeafOrdering {
  SORTED_BY_ID,
  KEEP,
};

struct BisectionContext {
  GainModel gain_model;

  //! Maximum number of local search rounds per bisection.
  std::size_t num_iterations;

  //! Subsets at this recursion depth are not split any further.
  std::size_t max_depth;

  //! Subsets with at most this many nodes are not split any further. The root is always split.
  NodeID min_partition_size;

  LeafOrdering leaf_ordering;
};

//
// Parallelism
//

struct ParallelContext {
  int num_threads;

  //! Subproblems below this recursion depth are never spawned as parallel tasks.
  std::size_t max_parallel_depth;

  //! Subproblems and loops over fewer nodes are processed sequentially.
  NodeID min_parallel_size;
};

struct DebugContext {
  std::string graph_name;

  //! Checks that the computed permutation is a bijection before returning it.
  bool validate_permutation;
};

struct Context {
  BisectionContext bisection;
  ParallelContext parallel;
  DebugContext debug;
};

std::unordered_set<std::string> get_preset_names();

Context create_context_by_preset_name(const std::string &name);

Context create_default_context();
Context create_fast_context();
Context create_strong_context();

class Graph;

} // namespace bigap

namespace bigap {

enum class OutputLevel : std::uint8_t {
  QUIET,       //! Disable all output to stdout.
  PROGRESS,    //! Continuously output progress information while reordering.
  APPLICATION, //! Also output the application banner and context summary.
  EXPERIMENT,  //! Also output information only relevant for benchmarking.
  DEBUG,       //! Also output (a sane amount) of debug information.
};

class BiGap {
public:
  BiGap();
  BiGap(int num_threads, Context ctx);

  BiGap(const BiGap &) = delete;
  BiGap &operator=(const BiGap &) = delete;

  BiGap(BiGap &&) noexcept = default;
  BiGap &operator=(BiGap &&) noexcept = default;

  ~BiGap();

  /*!
   * Sets the verbosity of the reordering.
   *
   * @param output_level Verbosity level, higher values mean more output.
   */
  void set_output_level(OutputLevel output_level);

  /*!
   * Sets the maximum depth of the timer tree. Only meaningful if the output level is set to
   * `APPLICATION` or `EXPERIMENT`.
   *
   * @param max_timer_depth The maximum depth of the timer stack.
   */
  void set_max_timer_depth(int max_timer_depth);

  /*!
   * Returns a non-const reference to the context object, which can be used to configure the
   * reordering process.
   *
   * @return Reference to the context object.
   */
  Context &context();

  /*!
   * Sets the graph to be reordered by copying the given CSR arrays. The graph is validated and a
   * `LoadError` is thrown if it is malformed.
   *
   * @param xadj Array of length `n + 1`, where `xadj[u]` points to the first out-neighbor of node
   * `u` in `adjncy`. In other words, the out-neighbors of `u` are `adjncy[xadj[u]..xadj[u+1]-1]`.
   * @param adjncy Array of length `xadj[n]` storing the out-neighbors of all nodes.
   */
  void copy_graph(std::span<const EdgeID> xadj, std::span<const NodeID> adjncy);

  /*!
   * Sets the graph to be reordered.
   *
   * @param graph The graph to be reordered.
   */
  void set_graph(Graph graph);

  /*!
   * Takes ownership of the graph set to be reordered.
   *
   * @return The graph set to be reordered.
   */
  Graph take_graph();

  const Graph *graph();

  /*!
   * Computes a node ordering of the graph set by `copy_graph()` or `set_graph()` by recursive
   * graph bisection.
   *
   * @param[out] permutation Span of length `n`; `permutation[u]` receives the new ID of node `u`.
   *
   * @return Estimated log-gap cost of the adjacency lists after relabeling, in bits.
   */
  double compute_permutation(std::span<NodeID> permutation);

  /*!
   * Computes a node ordering of the graph set by `copy_graph()` or `set_graph()` by recursive
   * graph bisection.
   *
   * @return Vector of length `n`, where entry `u` holds the new ID of node `u`.
   */
  std::vector<NodeID> compute_permutation();

private:
  int _num_threads;

  int _max_timer_depth = std::numeric_limits<int>::max();
  OutputLevel _output_level = OutputLevel::APPLICATION;
  Context _ctx;

  std::unique_ptr<Graph> _graph_ptr;
  tbb::global_control _gc;
};

} // namespace bigap

#endif
