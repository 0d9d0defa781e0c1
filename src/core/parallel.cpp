#include <memory>
#include <promol/core/log.h>
#include <promol/core/parallel.h>
#include <tbb/global_control.h>

namespace promol::parallel {

namespace {
std::unique_ptr<tbb::global_control> thread_limit;
}

void set_num_threads(int threads) {
  nthreads = std::max(1, threads);
  thread_limit = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(nthreads));
  promol::log::debug("Set number of threads to {}", nthreads);
}

} // namespace promol::parallel
