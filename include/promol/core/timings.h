#pragma once
#include <array>
#include <chrono>
#include <cstddef>

namespace promol::timing {

using duration_t = std::chrono::duration<double>;
using clock_t = std::chrono::steady_clock;
using time_point_t = clock_t::time_point;

enum category {
  io,
  tables,
  density,
  weight,
  sampling,
  grid,
  global,
  _group_count
};

/**
 * Accumulating wall clock timers, one slot per index.
 *
 * start(i)/stop(i) pairs add to the total for slot i and count the number
 * of intervals recorded.
 */
template <size_t count = 1> class StopWatch {
public:
  time_point_t start(size_t t = 0) {
    m_started[t] = clock_t::now();
    return m_started[t];
  }

  duration_t stop(size_t t = 0) {
    const duration_t elapsed = clock_t::now() - m_started[t];
    m_totals[t] += elapsed;
    m_intervals[t]++;
    return elapsed;
  }

  double read(size_t t = 0) const { return m_totals[t].count(); }
  size_t intervals(size_t t = 0) const { return m_intervals[t]; }

  void clear_all() {
    m_totals.fill(duration_t::zero());
    m_started.fill(time_point_t{});
    m_intervals.fill(0);
  }

private:
  std::array<duration_t, count> m_totals{};
  std::array<time_point_t, count> m_started{};
  std::array<size_t, count> m_intervals{};
};

// Process-wide timers for the driver. Not thread safe, so library
// functions never touch them.
time_point_t start(category cat);
duration_t stop(category cat);
double total(category cat);
size_t intervals(category cat);
void clear_all();

const char *category_name(category);

/// Log the total for every category that was used, relative to global.
void print_timings();

} // namespace promol::timing
