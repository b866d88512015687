#include "Parallelism.hpp"

#include <algorithm>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <tbb/info.h>
#include <tbb/task_arena.h>

namespace weld {

std::size_t defaultParallelism() noexcept {
  const int cores = tbb::info::default_concurrency();
  return cores > 0 ? static_cast<std::size_t>(cores) : 1;
}

WorkerPool::WorkerPool(const std::size_t numThreads)
    : numThreads(std::max<std::size_t>(numThreads, 1)),
      arena(static_cast<int>(this->numThreads)) {
  spdlog::debug("worker pool: {} thread(s)", this->numThreads);
}

} // namespace weld
