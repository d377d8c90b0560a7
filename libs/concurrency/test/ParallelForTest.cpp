#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace psepower::concurrency;

TEST_CASE("parallel_for visits every index once", "[parallel_for]")
{
  SECTION("Zero iterations submit nothing")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](uint32_t) { counter.fetch_add(1); });

    REQUIRE(counter.load() == 0);
  }

  SECTION("Single thread keeps index order")
  {
    SingleThreadExecutor executor;
    std::vector<uint32_t> order;

    parallel_for(17, executor, [&order](uint32_t i) { order.push_back(i); });

    REQUIRE(order.size() == 17);
    REQUIRE(std::is_sorted(order.begin(), order.end()));
  }

  SECTION("Pooled execution writes each slot exactly once")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited)
      v.store(0);

    parallel_for(1000, executor, [&visited](uint32_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (const auto& v : visited)
      REQUIRE(v.load() == 1);
  }

  SECTION("Results do not depend on the executor")
  {
    std::vector<double> serial(64), pooled(64);
    SingleThreadExecutor single;
    ThreadPoolExecutor<4> pool;

    parallel_for(64, single, [&serial](uint32_t i) { serial[i] = i * 0.5; });
    parallel_for(64, pool, [&pooled](uint32_t i) { pooled[i] = i * 0.5; });

    REQUIRE(serial == pooled);
  }

  SECTION("Body exceptions propagate to the caller")
  {
    ThreadPoolExecutor<2> executor;
    REQUIRE_THROWS_AS(parallel_for(10, executor, [](uint32_t i) {
	if (i == 7)
	  throw std::runtime_error("bad replication");
      }), std::runtime_error);
  }
}
