/*******************************************************************************
 * Helper functions for console IO.
 *
 * @file:   console_io.cc
 * @date:   02.03.2026
 ******************************************************************************/
#include "bigap-common/console_io.h"

#include <array>
#include <string_view>

#include "bigap-common/assert.h"
#include "bigap-common/environment.h"

namespace bigap::cio {
namespace {
constexpr std::size_t kLineWidth = 80;
constexpr std::size_t kBannerIndent = 22;

constexpr std::array<std::string_view, 7> kBanner = {
    R"( ____   _   ____               )",
    R"(| __ ) (_) / ___|  __ _  _ __  )",
    R"(|  _ \ | || |  _  / _` || '_ \ )",
    R"(| |_) || || |_| || (_| || |_) |)",
    R"(|____/ |_| \____| \__,_|| .__/ )",
    R"(                        |_|    )",
    R"()",
};
} // namespace

void print_delimiter(const std::string &caption, const char ch) {
  if (caption.empty()) {
    LOG << std::string(kLineWidth, ch);
  } else {
    LOG << std::string(kLineWidth - caption.size() - 5, ch) << " " << caption << " "
        << std::string(3, ch);
  }
}

void print_bigap_banner() {
  print_delimiter();
  for (std::size_t i = 0; i < kBanner.size(); ++i) {
    std::string line = "#" + std::string(kBannerIndent, ' ') + std::string(kBanner[i]);
    line.resize(kLineWidth - 1, ' ');
    line += '#';

#if KASSERT_ENABLED(ASSERTION_LEVEL_NORMAL)
    if (i == 0) {
      constexpr std::string_view kAssertions = "#ASSERTIONS#";
      line.replace(kLineWidth - kAssertions.size(), kAssertions.size(), kAssertions);
    }
#endif

    LOG << line;
  }
  print_delimiter();
}

void print_build_identifier() {
  LOG << "Current commit hash:          "
      << (Environment::GIT_SHA1.empty() ? "<not available>" : Environment::GIT_SHA1);

  std::string assertion_level_name = "always";
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_LIGHT) {
    assertion_level_name += "+light";
  }
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_NORMAL) {
    assertion_level_name += "+normal";
  }
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_HEAVY) {
    assertion_level_name += "+heavy";
  }
  LOG << "Assertion level:              " << assertion_level_name;

#ifdef BIGAP_ENABLE_TIMERS
  LOG << "Timers:                       enabled";
#else  // BIGAP_ENABLE_TIMERS
  LOG << "Timers:                       disabled";
#endif // BIGAP_ENABLE_TIMERS

  LOG << "Built on:                     "
      << (Environment::HOSTNAME.empty() ? "<not available>" : Environment::HOSTNAME);
}

} // namespace bigap::cio
