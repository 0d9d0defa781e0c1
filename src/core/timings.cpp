#include <promol/core/log.h>
#include <promol/core/timings.h>

namespace promol::timing {

namespace {

StopWatch<_group_count> &stopwatch() {
  static StopWatch<_group_count> sw;
  return sw;
}

constexpr const char *names[_group_count] = {
    "file input/output",   "radial table setup",   "promolecule density",
    "stockholder weight",  "sphere radii sampling", "angular grid",
    "Global (total time)"};

} // namespace

time_point_t start(category cat) { return stopwatch().start(cat); }

duration_t stop(category cat) { return stopwatch().stop(cat); }

double total(category cat) { return stopwatch().read(cat); }

size_t intervals(category cat) { return stopwatch().intervals(cat); }

void clear_all() { stopwatch().clear_all(); }

const char *category_name(category cat) {
  if (cat < 0 || cat >= _group_count)
    return "other";
  return names[cat];
}

void print_timings() {
  const double global_time = total(global);
  log::info("{:<30s} {:>12s} {:>8s} {:>7s}", "Wall clock time", "(s)",
            "calls", "%");
  for (int i = 0; i < _group_count; i++) {
    const auto cat = static_cast<category>(i);
    if (intervals(cat) == 0)
      continue;
    const double t = total(cat);
    const double percent = global_time > 0 ? 100.0 * t / global_time : 0.0;
    log::info("{:<30s} {:12.6f} {:8d} {:7.2f}", category_name(cat), t,
              intervals(cat), percent);
  }
}

} // namespace promol::timing
