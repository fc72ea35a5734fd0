#include <catch2/catch_test_macros.hpp>

#include "core/WorkerService.h"

#include <atomic>
#include <stdexcept>

namespace worker_service {

TEST_CASE("Every submitted task runs", "[worker]") {
  WorkerService pool(3, "Test");
  CHECK(pool.threadCount() == 3);

  std::atomic<int> count{0};
  for (int i = 0; i < 100; ++i)
    REQUIRE(pool.submitTask([&count] { ++count; }));
  pool.waitIdle();
  CHECK(count == 100);
}

TEST_CASE("A throwing task does not stop the pool", "[worker]") {
  WorkerService pool(1, "Test");
  std::atomic<int> count{0};
  pool.submitTask([] { throw std::runtime_error("boom"); });
  pool.submitTask([&count] { ++count; });
  pool.waitIdle();
  CHECK(count == 1);
}

TEST_CASE("A task throwing a non-standard type does not stop the pool",
          "[worker]") {
  WorkerService pool(1, "Test");
  std::atomic<int> count{0};
  REQUIRE(pool.submitTask([] { throw 42; }));
  REQUIRE(pool.submitTask([&count] { ++count; }));
  pool.waitIdle();
  CHECK(count == 1);
}

TEST_CASE("Stopping drains the queue and rejects new work", "[worker]") {
  std::atomic<int> count{0};
  WorkerService pool(1, "Test");
  for (int i = 0; i < 10; ++i)
    pool.submitTask([&count] { ++count; });
  pool.stop();
  CHECK(count == 10);
  CHECK_FALSE(pool.submitTask([&count] { ++count; }));
  CHECK(count == 10);
}

TEST_CASE("Zero threads means one", "[worker]") {
  WorkerService pool(0);
  CHECK(pool.threadCount() == 1);
}

} // namespace worker_service
