#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <thread>
#include <vector>

namespace concurrency
{
  // Split [0, total) into at most hardware_concurrency contiguous chunks,
  // submit one task per chunk and wait for all of them. body(i) is called
  // exactly once for every index.
  template <typename Executor, typename Body>
  void parallel_for(std::size_t total, Executor& exec, Body body)
  {
    if (total == 0)
      return;

    const unsigned hw = std::thread::hardware_concurrency();
    const std::size_t numChunks = hw ? hw : 2;
    const std::size_t chunkSize = (total + numChunks - 1) / numChunks;

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() {
	      for (std::size_t i = start; i < end; ++i)
		body(i);
	    }));
      }
    exec.waitAll(futures);
  }
}
