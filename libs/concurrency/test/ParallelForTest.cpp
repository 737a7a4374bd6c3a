#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace concurrency;

TEST_CASE("parallel_for_each basic operations", "[parallel_for_each]")
{
  SECTION("Every element visited with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<std::size_t> items = {3, 1, 4, 1, 5};
    std::vector<std::size_t> seen;

    parallel_for_each(executor, items, [&seen](std::size_t v) { seen.push_back(v); });

    REQUIRE(seen == items);
  }

  SECTION("Empty container submits nothing")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::size_t> items;
    std::atomic<int> counter{0};

    parallel_for_each(executor, items, [&counter](std::size_t) { counter.fetch_add(1); });

    REQUIRE(counter.load() == 0);
  }

  SECTION("Fewer elements than workers")
  {
    ThreadPoolExecutor executor(8);
    std::vector<std::size_t> items = {7, 8};
    std::atomic<std::size_t> sum{0};

    parallel_for_each(executor, items, [&sum](std::size_t v) { sum.fetch_add(v); });

    REQUIRE(sum.load() == 15);
  }

  SECTION("All elements are visited exactly once")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::size_t> items(1000);
    std::iota(items.begin(), items.end(), 0);
    std::vector<std::atomic<int>> visited(items.size());
    for (auto& v : visited)
      v.store(0);

    parallel_for_each(executor, items, [&visited](std::size_t i) { visited[i].fetch_add(1); });

    REQUIRE(std::all_of(visited.begin(), visited.end(),
			[](const std::atomic<int>& v) { return v.load() == 1; }));
  }

  SECTION("Writes to distinct slots need no locking")
  {
    StdAsyncExecutor executor;
    std::vector<std::size_t> items(64);
    std::iota(items.begin(), items.end(), 0);
    std::vector<std::size_t> squares(items.size(), 0);

    parallel_for_each(executor, items, [&squares](std::size_t i) { squares[i] = i * i; });

    for (std::size_t i = 0; i < items.size(); ++i)
      REQUIRE(squares[i] == i * i);
  }
}

TEST_CASE("parallel_for_each exception handling", "[parallel_for_each][Exception]")
{
  SECTION("Exception from one element is rethrown")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::size_t> items(100);
    std::iota(items.begin(), items.end(), 0);

    REQUIRE_THROWS_AS(parallel_for_each(executor, items, [](std::size_t i) {
	  if (i == 42)
	    throw std::domain_error("bad element");
	}), std::domain_error);
  }

  SECTION("Other chunks finish before the exception escapes")
  {
    ThreadPoolExecutor executor(4);
    std::vector<std::size_t> items(8);
    std::iota(items.begin(), items.end(), 0);
    std::atomic<int> completed{0};

    REQUIRE_THROWS(parallel_for_each(executor, items, [&completed](std::size_t i) {
	  if (i == 0)
	    throw std::runtime_error("first chunk fails");
	  std::this_thread::sleep_for(std::chrono::milliseconds(5));
	  completed.fetch_add(1);
	}));

    // Element 0 shares its chunk with element 1, which never runs; every
    // other chunk ran to completion before parallel_for_each returned.
    REQUIRE(completed.load() == 6);
  }
}
