/*******************************************************************************
 * Hierarchical wall-clock timer.
 *
 * @file:   timer.cc
 * @date:   02.03.2026
 ******************************************************************************/
#include "bigap-common/timer.h"

#include <algorithm>
#include <cctype>
#include <iomanip>

namespace bigap {
namespace {
constexpr std::string_view kBranch = "|- ";
constexpr std::string_view kEdge = "|  ";
constexpr std::string_view kTailBranch = "`- ";
constexpr std::string_view kTailEdge = "   ";
constexpr std::string_view kNameDelimiter = ": ";

std::string make_machine_readable(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](const unsigned char ch) {
    return ch == ' ' ? '_' : static_cast<char>(std::tolower(ch));
  });
  return str;
}

void print_padded_time(std::ostream &out, const Timer::Node &node, const std::size_t padding) {
  out << kNameDelimiter;
  if (padding > 1) {
    out << std::string(padding - 1, '.') << ' ';
  } else if (padding == 1) {
    out << ' ';
  }

  out << std::fixed << std::setprecision(3) << node.seconds() << " s";
  if (node.restarts > 1) {
    out << " (" << node.restarts << ")";
  }
}
} // namespace

Timer::Timer(std::string name) : _name(std::move(name)) {
  _root.name = _name;
  _root.start = timer::Clock::now();
}

Timer &Timer::global() {
  static Timer timer("Global Timer");
  return timer;
}

void Timer::start_timer(const std::string_view name) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_disabled > 0) {
    return;
  }

  auto it = _current->children_by_name.find(name);
  if (it == _current->children_by_name.end()) {
    auto &child = _current->children.emplace_back(std::make_unique<Node>());
    child->name = std::string(name);
    child->parent = _current;
    it = _current->children_by_name.emplace(child->name, child.get()).first;
  }

  _current = it->second;
  ++_current->restarts;
  _current->start = timer::Clock::now();
}

void Timer::stop_timer() {
  const auto end = timer::Clock::now();

  std::lock_guard<std::mutex> lock(_mutex);
  if (_disabled > 0 || _current == &_root) {
    return;
  }

  _current->elapsed += end - _current->start;
  _current = _current->parent;
}

void Timer::enable() {
  std::lock_guard<std::mutex> lock(_mutex);
  _disabled = std::max(0, _disabled - 1);
}

void Timer::disable() {
  std::lock_guard<std::mutex> lock(_mutex);
  ++_disabled;
}

void Timer::reset() {
  std::lock_guard<std::mutex> lock(_mutex);
  _root.children.clear();
  _root.children_by_name.clear();
  _root.elapsed = {};
  _root.start = timer::Clock::now();
  _current = &_root;
  _disabled = 0;
}

double Timer::elapsed_seconds() const {
  return std::chrono::duration<double>(timer::Clock::now() - _root.start).count();
}

void Timer::print_human_readable(std::ostream &out, const int max_depth) {
  if (max_depth < 0) {
    return;
  }

  _root.elapsed = timer::Clock::now() - _root.start;

  const std::size_t time_col = compute_time_col(_root, 0, max_depth);
  out << _root.name;
  print_padded_time(out, _root, time_col - _root.name.size());
  out << "\n";

  print_children_hr(out, _root, "", time_col, max_depth - 1);
  out << std::flush;
}

void Timer::print_children_hr(
    std::ostream &out,
    const Node &node,
    const std::string &prefix,
    const std::size_t time_col,
    const int depth
) const {
  if (depth < 0) {
    return;
  }

  for (const auto &child : node.children) {
    const bool is_last = child == node.children.back();
    const std::string branch = prefix + std::string(is_last ? kTailBranch : kBranch);

    out << branch << child->name;
    print_padded_time(out, *child, time_col - branch.size() - child->name.size());
    out << "\n";

    print_children_hr(
        out, *child, prefix + std::string(is_last ? kTailEdge : kEdge), time_col, depth - 1
    );
  }
}

std::size_t
Timer::compute_time_col(const Node &node, const std::size_t prefix_len, const int depth) const {
  std::size_t col = prefix_len + node.name.size();
  if (depth > 0) {
    for (const auto &child : node.children) {
      col = std::max(col, compute_time_col(*child, prefix_len + kBranch.size(), depth - 1));
    }
  }
  return col;
}

void Timer::print_machine_readable(std::ostream &out, const int max_depth) {
  for (const auto &child : _root.children) {
    print_node_mr(out, *child, "", max_depth);
  }
  out << "\n" << std::flush;
}

void Timer::print_node_mr(
    std::ostream &out, const Node &node, const std::string &prefix, const int depth
) const {
  if (depth < 0) {
    return;
  }

  const std::string name = prefix + make_machine_readable(node.name);
  out << name << "=" << node.seconds() << " ";

  for (const auto &child : node.children) {
    print_node_mr(out, *child, name + ".", depth - 1);
  }
}
} // namespace bigap
