#pragma once

#include <cstddef>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>

namespace weld {

std::size_t defaultParallelism() noexcept;

// Bounded pool the executor dispatches component work onto.  Owned by the
// caller and passed down explicitly.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t numThreads = defaultParallelism());

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::size_t concurrency() const noexcept { return numThreads; }
  bool isParallel() const noexcept { return numThreads > 1; }

  // Calls `fn(i)` for every i in [0, count).  Each index is its own task, so
  // at most `concurrency()` run at once.  With a single worker the calls are
  // made in index order on the calling thread.
  template <typename Fn>
  void forEach(const std::size_t count, Fn&& fn) {
    if (!isParallel() || count <= 1) {
      for (std::size_t i = 0; i < count; ++i) {
        fn(i);
      }
      return;
    }

    arena.execute([&] {
      tbb::parallel_for(
          tbb::blocked_range<std::size_t>(0, count, 1),
          [&](const tbb::blocked_range<std::size_t>& rng) {
            for (std::size_t i = rng.begin(); i != rng.end(); ++i) {
              fn(i);
            }
          },
          tbb::simple_partitioner());
    });
  }

private:
  std::size_t numThreads;
  tbb::task_arena arena;
};

} // namespace weld
