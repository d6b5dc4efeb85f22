/*******************************************************************************
 * Thread-safe line logger with colored output and debug macros.
 *
 * @file:   logger.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <tbb/spin_mutex.h>

// Debug output
//
// Each translation unit that uses DBG must declare whether debug output is enabled via
// SET_DEBUG(true) or SET_DEBUG(false). Disabled DBG statements are removed by short-circuit
// evaluation and cost nothing at runtime.
#define BIGAP_FILENAME (std::strrchr(__FILE__, '/') ? std::strrchr(__FILE__, '/') + 1 : __FILE__)
#define BIGAP_POSITION BIGAP_FILENAME << ":" << __LINE__ << "(" << __func__ << ")"

#define SET_DEBUG(value) [[maybe_unused]] static constexpr bool kDebug = value
#define DBGC(cond)                                                                                 \
  (kDebug && (cond)) && bigap::DisposableLogger(std::cout)                                         \
                            << bigap::logger::MAGENTA << BIGAP_POSITION << " "                     \
                            << bigap::logger::DEFAULT_TEXT
#define DBG DBGC(true)
#define IF_DBG if constexpr (kDebug)

// Console output
//
// LOG prints one line without colors, LOG_SUCCESS, LOG_WARNING and LOG_ERROR print one colored
// line with a prefix. LLOG does not append a line break.
#define LOG (bigap::Logger())
#define LLOG (bigap::Logger(std::cout, ""))

#define LOG_ERROR (bigap::Logger(std::cerr) << bigap::logger::RED << "[Error] ")
#define LOG_SUCCESS (bigap::Logger(std::cout) << bigap::logger::GREEN << "[Success] ")
#define LOG_WARNING (bigap::Logger(std::cout) << bigap::logger::ORANGE << "[Warning] ")

// V(x) prints "x=<value of x> "
#define V(x) std::string(#x "=") << (x) << " "

namespace bigap {
namespace logger {
template <typename T, typename = void> struct is_iterable : std::false_type {};

template <typename T>
struct is_iterable<
    T,
    std::void_t<decltype(std::begin(std::declval<T>())), decltype(std::end(std::declval<T>()))>>
    : std::true_type {};

template <typename T>
constexpr bool is_container_v = !std::is_same_v<std::decay_t<T>, std::string> &&      //
                                !std::is_same_v<std::decay_t<T>, std::string_view> && //
                                !std::is_same_v<std::decay_t<T>, char *> &&           //
                                !std::is_same_v<std::decay_t<T>, const char *> &&     //
                                !std::is_array_v<std::remove_reference_t<T>> &&       //
                                is_iterable<T>::value;

enum class Color : std::uint8_t {
  NONE,
  RED,
  GREEN,
  MAGENTA,
  ORANGE,
  CYAN,
};

// Marker objects that switch the color of subsequent text
struct TextColor {
  Color color;
};

// Marker object that switches the separator used to print containers
struct ContainerSeparator {
  std::string_view separator;
};

extern const TextColor DEFAULT_TEXT;
extern const TextColor RED;
extern const TextColor GREEN;
extern const TextColor MAGENTA;
extern const TextColor ORANGE;
extern const TextColor CYAN;
extern const TextColor RESET;
extern const ContainerSeparator DEFAULT_CONTAINER;
extern const ContainerSeparator COMPACT;

void print_colored(std::string_view text, Color color, std::ostream &out);
} // namespace logger

class Logger {
public:
  Logger();
  explicit Logger(std::ostream &out, std::string append = "\n");

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  Logger(Logger &&) noexcept = default;
  Logger &operator=(Logger &&) = delete;

  ~Logger() {
    flush();
  }

  Logger &operator<<(const logger::TextColor color) {
    _color = color.color;
    return *this;
  }

  Logger &operator<<(const logger::ContainerSeparator separator) {
    _separator = separator.separator;
    return *this;
  }

  template <typename T, std::enable_if_t<logger::is_container_v<T>, bool> = true>
  Logger &operator<<(T &&container) {
    bool first = true;
    for (const auto &element : container) {
      if (!first) {
        *this << _separator;
      }
      *this << element;
      first = false;
    }
    return *this;
  }

  template <
      typename Arg,
      std::enable_if_t<
          !logger::is_container_v<Arg> &&
              !std::is_same_v<std::decay_t<Arg>, logger::TextColor> &&
              !std::is_same_v<std::decay_t<Arg>, logger::ContainerSeparator>,
          bool> = true>
  Logger &operator<<(Arg &&arg) {
    std::ostringstream ss;
    ss << arg;
    logger::print_colored(ss.str(), _color, _buffer);
    return *this;
  }

  void flush();

  static void set_quiet_mode(bool quiet);
  static bool is_quiet();

private:
  static std::atomic<bool> _quiet;

  static tbb::spin_mutex &flush_mutex();

  logger::Color _color = logger::Color::NONE;
  std::string_view _separator = ", ";

  std::ostringstream _buffer;
  std::ostream &_out;
  std::string _append;
  bool _flushed = false;
};

// Helper for DBG(): the logger is usable in a boolean context so that it can be discarded by
// short-circuit evaluation
class DisposableLogger {
public:
  template <typename... Args>
  explicit DisposableLogger(Args &&...args) : _logger(std::forward<Args>(args)...) {}

  ~DisposableLogger() {
    _logger << logger::RESET;
    _logger.flush();
  }

  template <typename Arg> DisposableLogger &operator<<(Arg &&arg) {
    _logger << std::forward<Arg>(arg);
    return *this;
  }

  operator bool() { // NOLINT
    return false;
  }

private:
  Logger _logger;
};
} // namespace bigap
