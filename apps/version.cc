/*******************************************************************************
 * Prints a detailed version message including the build configuration.
 *
 * @file:   version.cc
 * @date:   08.03.2026
 ******************************************************************************/
#include "apps/version.h"

#include <iostream>

#include <bigap-common/environment.h>
#include <bigap/bigap.h>
#include <bigap/context_io.h>
#include <tbb/version.h>

namespace bigap {

void print_version() {
  std::cout << "BiGap v" << BIGAP_VERSION_MAJOR << "." << BIGAP_VERSION_MINOR << "."
            << BIGAP_VERSION_PATCH << "\n";
  std::cout << "Git version: " << Environment::GIT_SHA1
            << ", built on host: " << Environment::HOSTNAME << "\n";
  std::cout << "Build configuration:\n";

#ifdef BIGAP_ENABLE_TIMERS
  std::cout << "  Timers: enabled\n";
#else
  std::cout << "  Timers: disabled\n";
#endif
#ifdef BIGAP_HAVE_NUMA
  std::cout << "  NUMA interleaving: enabled\n";
#else
  std::cout << "  NUMA interleaving: disabled\n";
#endif
  std::cout << "  Default gain model: " << create_default_context().bisection.gain_model << "\n";
  std::cout << "  Data types:\n";
  std::cout << "    Node IDs: " << sizeof(NodeID) * 8 << " bits\n";
  std::cout << "    Edge IDs: " << sizeof(EdgeID) * 8 << " bits\n";
  std::cout << "Built with oneTBB " << TBB_VERSION_MAJOR << "." << TBB_VERSION_MINOR << "\n";
}

} // namespace bigap
