#pragma once

#include <algorithm>  // for std::min
#include <cstddef>
#include <future>     // for std::future
#include <vector>     // for std::vector
#include "IParallelExecutor.h"

namespace concurrency {

  // Split the container into at most exec.numWorkers() contiguous chunks,
  // submit one task per chunk and wait for all of them. body(element) is
  // called exactly once per element. The first exception thrown by any body
  // is rethrown after every chunk has finished.
  template<typename Container, typename Body>
  void parallel_for_each(IParallelExecutor& exec, const Container& container, Body body) {
    if (container.empty()) return;

    const std::size_t total = container.size();
    const std::size_t numTasks = std::max<std::size_t>(1, std::min(total, exec.numWorkers()));
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize) {
      const std::size_t end = std::min(total, start + chunkSize);
      futures.emplace_back(
        exec.submit([&container, &body, start, end]() {
          for (std::size_t p = start; p < end; ++p) {
            body(container[p]);
          }
        })
      );
    }
    exec.waitAll(futures);
  }
}
