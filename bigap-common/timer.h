/*******************************************************************************
 * Hierarchical wall-clock timer.
 *
 * @file:   timer.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <chrono>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#define GLOBAL_TIMER (bigap::Timer::global())

#define BIGAP_SCOPED_TIMER_IMPL2(name, line)                                                       \
  auto __SCOPED_TIMER__##line = (GLOBAL_TIMER.start_scoped_timer(name))
#define BIGAP_SCOPED_TIMER_IMPL1(name, line) BIGAP_SCOPED_TIMER_IMPL2(name, line)

// Timers are compiled in only with -DBIGAP_ENABLE_TIMERS, otherwise all macros expand to nothing.
// Timers must only be started and stopped from the main thread: nested parallel sections are
// accounted to the timer that is active in the calling thread.
#ifdef BIGAP_ENABLE_TIMERS
#define SCOPED_TIMER(name) BIGAP_SCOPED_TIMER_IMPL1(name, __LINE__)
#define START_TIMER(name) (GLOBAL_TIMER.start_timer(name))
#define STOP_TIMER() (GLOBAL_TIMER.stop_timer())
#define ENABLE_TIMERS() (GLOBAL_TIMER.enable())
#define DISABLE_TIMERS() (GLOBAL_TIMER.disable())
#else // BIGAP_ENABLE_TIMERS
#define SCOPED_TIMER(name)
#define START_TIMER(name)
#define STOP_TIMER()
#define ENABLE_TIMERS()
#define DISABLE_TIMERS()
#endif // BIGAP_ENABLE_TIMERS

namespace bigap {
class Timer;

namespace timer {
using Clock = std::chrono::steady_clock;

class ScopedTimer {
public:
  explicit ScopedTimer(Timer *timer) : _timer(timer) {}

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

  ScopedTimer(ScopedTimer &&other) noexcept : _timer(other._timer) {
    other._timer = nullptr;
  }
  ScopedTimer &operator=(ScopedTimer &&) = delete;

  inline ~ScopedTimer();

private:
  Timer *_timer;
};
} // namespace timer

class Timer {
public:
  struct Node {
    std::string name;
    std::size_t restarts = 0;
    timer::Clock::duration elapsed{};
    timer::Clock::time_point start{};

    Node *parent = nullptr;
    std::vector<std::unique_ptr<Node>> children;
    std::map<std::string, Node *, std::less<>> children_by_name;

    [[nodiscard]] double seconds() const {
      return std::chrono::duration<double>(elapsed).count();
    }
  };

  static Timer &global();

  explicit Timer(std::string name);

  Timer(const Timer &) = delete;
  Timer &operator=(const Timer &) = delete;

  void start_timer(std::string_view name);
  void stop_timer();

  [[nodiscard]] timer::ScopedTimer start_scoped_timer(const std::string_view name) {
    start_timer(name);
    return timer::ScopedTimer(this);
  }

  void enable();
  void disable();

  //! Discards all measurements.
  void reset();

  [[nodiscard]] const Node &tree() const {
    return _root;
  }

  [[nodiscard]] double elapsed_seconds() const;

  //! Prints the timer tree, e.g.
  //!
  //! Global Timer: ...... 1.234 s
  //! |- Read input graph: 0.400 s
  //! `- Reordering: ..... 0.834 s
  //!    `- Bisection: ... 0.800 s (12)
  void print_human_readable(std::ostream &out, int max_depth = std::numeric_limits<int>::max());

  //! Prints the timer tree as space-separated key=value pairs, e.g.,
  //! read_input_graph=0.400 reordering=0.834 reordering.bisection=0.800
  void print_machine_readable(std::ostream &out, int max_depth = std::numeric_limits<int>::max());

private:
  void print_children_hr(
      std::ostream &out, const Node &node, const std::string &prefix, std::size_t time_col, int depth
  ) const;

  void print_node_mr(std::ostream &out, const Node &node, const std::string &prefix, int depth)
      const;

  [[nodiscard]] std::size_t
  compute_time_col(const Node &node, std::size_t prefix_len, int depth) const;

  std::string _name;
  Node _root;
  Node *_current = &_root;
  int _disabled = 0;
  std::mutex _mutex;
};

namespace timer {
ScopedTimer::~ScopedTimer() {
  if (_timer != nullptr) {
    _timer->stop_timer();
  }
}
} // namespace timer
} // namespace bigap
