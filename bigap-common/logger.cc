/*******************************************************************************
 * Thread-safe line logger with colored output and debug macros.
 *
 * @file:   logger.cc
 * @date:   02.03.2026
 ******************************************************************************/
#include "bigap-common/logger.h"

namespace bigap {
namespace logger {
void print_colored(const std::string_view text, const Color color, std::ostream &out) {
  switch (color) {
  case Color::NONE:
    out << text;
    return;

  case Color::RED:
    out << "\u001b[31m";
    break;

  case Color::GREEN:
    out << "\u001b[32m";
    break;

  case Color::ORANGE:
    out << "\u001b[33m";
    break;

  case Color::MAGENTA:
    out << "\u001b[35m";
    break;

  case Color::CYAN:
    out << "\u001b[36m";
    break;
  }

  out << text << "\u001b[0m";
}

const TextColor DEFAULT_TEXT{Color::NONE};
const TextColor RED{Color::RED};
const TextColor GREEN{Color::GREEN};
const TextColor MAGENTA{Color::MAGENTA};
const TextColor ORANGE{Color::ORANGE};
const TextColor CYAN{Color::CYAN};
const TextColor RESET{Color::NONE};
const ContainerSeparator DEFAULT_CONTAINER{", "};
const ContainerSeparator COMPACT{","};
} // namespace logger

std::atomic<bool> Logger::_quiet = false;

Logger::Logger() : Logger(std::cout) {}

Logger::Logger(std::ostream &out, std::string append) : _out(out), _append(std::move(append)) {}

void Logger::flush() {
  // Quiet mode only silences stdout: errors on stderr are always printed
  if (_flushed || (_quiet && &_out == &std::cout)) {
    return;
  }

  {
    tbb::spin_mutex::scoped_lock lock(flush_mutex());
    _out << _buffer.str() << _append << std::flush;
  }

  _flushed = true;
}

tbb::spin_mutex &Logger::flush_mutex() {
  static tbb::spin_mutex mutex;
  return mutex;
}

void Logger::set_quiet_mode(const bool quiet) {
  _quiet = quiet;
}

bool Logger::is_quiet() {
  return _quiet;
}
} // namespace bigap
