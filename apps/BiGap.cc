/*******************************************************************************
 * Standalone binary that reorders a graph by recursive graph bisection.
 *
 * @file:   BiGap.cc
 * @date:   08.03.2026
 ******************************************************************************/
// clang-format off
#include "bigap-cli/bigap_arguments.h"
#include "bigap/bigap.h"
// clang-format on

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <new>
#include <string>
#include <vector>

#include <tbb/scalable_allocator.h>

#ifdef BIGAP_HAVE_NUMA
#include <numa.h>
#endif // BIGAP_HAVE_NUMA

#include "bigap/datastructures/graph.h"

#include "bigap-common/errors.h"
#include "bigap-common/logger.h"
#include "bigap-common/timer.h"

#include "apps/io/graph_io.h"
#include "apps/version.h"

#if defined(__linux__)
#include <sys/resource.h>
#endif

using namespace bigap;

namespace {

struct ApplicationContext {
  bool dump_config = false;
  bool show_version = false;

  int num_threads = 1;

  int max_timer_depth = 3;

  bool quiet = false;
  bool experiment = false;
  bool validate = false;
  bool debug = false;

  std::string graph_filename = "";
  io::GraphFileFormat graph_file_format = io::GraphFileFormat::BIN;

  std::string permutation_filename = "";
  io::permutation::OutputFormat permutation_format = io::permutation::OutputFormat::BINARY;

  bool no_huge_pages = false;

  bool dry_run = false;
};

void setup_context(CLI::App &cli, ApplicationContext &app, Context &ctx) {
  cli.set_config("-C,--config", "", "Read parameters from a TOML configuration file.", false);
  cli.add_option_function<std::string>(
         "-P,--preset",
         [&](const std::string preset) { ctx = create_context_by_preset_name(preset); }
  )
      ->check(CLI::IsMember(get_preset_names()))
      ->description(R"(Use configuration preset:
  - fast:    few local search rounds and large leaves
  - default: in-between
  - strong:  many local search rounds and small leaves)");

  // Mandatory
  auto *mandatory = cli.add_option_group("Application")->require_option(1);

  // Mandatory -> either dump config ...
  mandatory->add_flag("--dump-config", app.dump_config)
      ->configurable(false)
      ->description(R"(Print the current configuration and exit.
The output should be stored in a file and can be used by the -C,--config option.)");
  mandatory->add_flag("-v,--version", app.show_version, "Show version and exit.");

  // Mandatory -> ... or reorder a graph
  auto *rgb_group = mandatory->add_option_group("Reordering")->silent();
  rgb_group->add_option("-G,--graph", app.graph_filename, "Input graph.")
      ->check(CLI::ExistingFile)
      ->configurable(false)
      ->required();
  rgb_group
      ->add_option(
          "-o,--output", app.permutation_filename, "Output filename for the node permutation."
      )
      ->configurable(false)
      ->required();

  // Application options
  cli.add_flag("-q,--quiet", app.quiet, "Suppress all console output.");
  cli.add_option("-t,--threads", app.num_threads, "Number of threads to be used.")
      ->check(CLI::PositiveNumber)
      ->default_val(app.num_threads);
  cli.add_flag("-E,--experiment", app.experiment, "Use an output format that is easier to parse.");
  cli.add_flag(
      "-D,--debug",
      app.debug,
      "Same as -E, but print additional debug information (that might impose a running time "
      "penalty)."
  );
  cli.add_option(
      "--max-timer-depth", app.max_timer_depth, "Set maximum timer depth shown in result summary."
  );
  cli.add_flag_function("-T,--all-timers", [&](auto) {
    app.max_timer_depth = std::numeric_limits<int>::max();
  });
  cli.add_option("-f,--graph-file-format", app.graph_file_format)
      ->transform(CLI::CheckedTransformer(io::get_graph_file_formats()).description(""))
      ->description(R"(Graph file formats:
  - bin:   uncompressed binary adjacency lists
  - metis: METIS text format, one directed adjacency list per line)")
      ->capture_default_str();
  cli.add_option("--output-format", app.permutation_format)
      ->transform(CLI::CheckedTransformer(io::permutation::get_output_formats()).description(""))
      ->description(R"(Permutation file formats:
  - binary: one 64 bit big-endian integer per node
  - text:   one new node ID per line)")
      ->capture_default_str();

  cli.add_flag(
      "--validate",
      app.validate,
      "Validate the input graph and the computed permutation."
  );
  cli.add_flag("--no-huge-pages", app.no_huge_pages, "Do not use huge pages via TBBmalloc.");

  cli.add_flag(
      "--dry-run",
      app.dry_run,
      "Only check the given command line arguments, but do not reorder the graph."
  );

  // Algorithmic options
  create_all_options(&cli, ctx);
}

inline void print_rss(const ApplicationContext &app) {
  if (!app.quiet) {
    std::cout << "\n";

#if defined(__linux__)
    if (struct rusage usage; getrusage(RUSAGE_SELF, &usage) == 0) {
      std::cout << "Maximum resident set size: " << usage.ru_maxrss << " KiB\n";
    } else {
#else
    {
#endif
      std::cout << "Maximum resident set size: unknown\n";
    }

    std::cout << std::flush;
  }
}

int run(const ApplicationContext &app, const Context &ctx) {
  // If available, use huge pages for large allocations
  scalable_allocation_mode(TBBMALLOC_USE_HUGE_PAGES, !app.no_huge_pages);

  // Setup the BiGap instance
  BiGap reorderer(app.num_threads, ctx);

  if (app.quiet) {
    reorderer.set_output_level(OutputLevel::QUIET);
  } else if (app.debug) {
    reorderer.set_output_level(OutputLevel::DEBUG);
  } else if (app.experiment) {
    reorderer.set_output_level(OutputLevel::EXPERIMENT);
  }

  reorderer.context().debug.graph_name =
      std::filesystem::path(app.graph_filename).filename().string();
  if (app.validate) {
    reorderer.context().debug.validate_permutation = true;
  }
  reorderer.set_max_timer_depth(app.max_timer_depth);

  // Graphs are always validated while reading: the reordering relies on neighbors in [0, n)
  Graph graph = [&] {
    SCOPED_TIMER("Read input graph");
    return io::read(app.graph_filename, app.graph_file_format);
  }();

  std::vector<NodeID> permutation(graph.n());

  reorderer.set_graph(std::move(graph));
  reorderer.compute_permutation(permutation);

  io::permutation::write(app.permutation_filename, permutation, app.permutation_format);
  LOG_SUCCESS << "Wrote permutation of " << permutation.size() << " nodes to "
              << app.permutation_filename;

  print_rss(app);

  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
#ifdef BIGAP_HAVE_NUMA
  if (numa_available() >= 0) {
    numa_set_interleave_mask(numa_all_nodes_ptr);
  }
#endif // BIGAP_HAVE_NUMA

  CLI::App cli("BiGap: Recursive Graph Bisection for Gap-Encoding Friendly Node Orders");
  ApplicationContext app;
  Context ctx = create_default_context();
  setup_context(cli, app, ctx);
  CLI11_PARSE(cli, argc, argv);

  if (app.dump_config) {
    CLI::App dump;
    create_all_options(&dump, ctx);
    std::cout << dump.config_to_str(true, true);
    std::exit(1);
  }

  if (app.show_version) {
    print_version();
    std::exit(0);
  }

  if (app.dry_run) {
    std::exit(0);
  }

  if (app.quiet) {
    Logger::set_quiet_mode(true);
  }

  try {
    return run(app, ctx);
  } catch (const LoadError &e) {
    LOG_ERROR << "Cannot load the input graph: " << e.what();
  } catch (const IOError &e) {
    LOG_ERROR << "Cannot write the permutation: " << e.what();
  } catch (const InternalError &e) {
    LOG_ERROR << "Internal error: " << e.what();
  } catch (const std::bad_alloc &e) {
    LOG_ERROR << "Out of memory: " << e.what();
  }

  return EXIT_FAILURE;
}
