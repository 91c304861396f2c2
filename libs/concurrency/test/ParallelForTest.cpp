#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace concurrency;

TEST_CASE("parallel_for visits every index", "[parallel_for]")
{
  SECTION("SingleThreadExecutor runs indices in order")
  {
    SingleThreadExecutor executor;
    std::vector<std::size_t> order;

    parallel_for(10, executor, [&order](std::size_t i) {
      order.push_back(i);
    });

    REQUIRE(order.size() == 10);
    REQUIRE(std::is_sorted(order.begin(), order.end()));
  }

  SECTION("ThreadPoolExecutor visits each index exactly once")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited)
      v.store(0);

    parallel_for(visited.size(), executor, [&visited](std::size_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (const auto& v : visited)
      REQUIRE(v.load() == 1);
  }

  SECTION("Zero iterations submit nothing")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](std::size_t) { counter.fetch_add(1); });

    REQUIRE(counter.load() == 0);
  }

  SECTION("Per-slot writes need no locking")
  {
    ThreadPoolExecutor executor(3);
    std::vector<std::uint64_t> slots(257, 0);

    parallel_for(slots.size(), executor, [&slots](std::size_t i) {
      slots[i] = static_cast<std::uint64_t>(i) * i;
    });

    for (std::size_t i = 0; i < slots.size(); ++i)
      REQUIRE(slots[i] == static_cast<std::uint64_t>(i) * i);
  }
}

TEST_CASE("parallel_for propagates task exceptions", "[parallel_for]")
{
  ThreadPoolExecutor executor(2);

  REQUIRE_THROWS_AS(parallel_for(16, executor, [](std::size_t i) {
	if (i == 7)
	  throw std::runtime_error("cell failure");
      }),
    std::runtime_error);
}
