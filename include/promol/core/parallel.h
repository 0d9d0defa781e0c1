#pragma once
#include <algorithm>
#include <cstddef>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace promol::parallel {
inline int nthreads = 1;

void set_num_threads(int threads);

inline int get_num_threads() { return nthreads; }

/*
 * Split [begin, end) into blocked ranges and call func(l, u) on each.
 * func must only write to state indexed by [l, u).
 */
template <typename Func>
void parallel_for(size_t begin, size_t end, Func &&func, size_t grain = 0) {
  if (end <= begin)
    return;
  const size_t total = end - begin;
  if (grain == 0) {
    const size_t max_chunks = static_cast<size_t>(nthreads) * 8;
    grain = std::max(size_t(1), total / max_chunks);
  }
  if (nthreads <= 1) {
    func(begin, end);
    return;
  }
  tbb::parallel_for(tbb::blocked_range<size_t>(begin, end, grain),
                    [&](const tbb::blocked_range<size_t> &range) {
                      func(range.begin(), range.end());
                    });
}

} // namespace promol::parallel
