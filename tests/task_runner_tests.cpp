// tests/task_runner_tests.cpp
//
// Background task execution and thread reclamation.

#include <doctest/doctest.h>

#include "mplaunch/task_runner.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace mplaunch;
using namespace std::chrono_literals;

namespace {

// A task flags itself done just after its future becomes ready.
bool drainsWithin(TaskRunner &runner, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    runner.pruneFinished();
    if (runner.threadCount() == 0)
      return true;
    std::this_thread::sleep_for(1ms);
  }
  return false;
}

} // namespace

TEST_CASE("TaskRunner delivers results through the future") {
  auto sum = TaskRunner::instance().async([](int a, int b) { return a + b; },
                                          2, 3);
  CHECK(sum.get() == 5);
}

TEST_CASE("TaskRunner joins threads whose task has returned") {
  auto &runner = TaskRunner::instance();

  std::vector<std::future<int>> results;
  for (int i = 0; i < 8; ++i)
    results.push_back(runner.async([i]() { return i * i; }));
  for (int i = 0; i < 8; ++i)
    CHECK(results[i].get() == i * i);

  CHECK(drainsWithin(runner, 2000ms));
}

TEST_CASE("a long session does not accumulate finished threads") {
  auto &runner = TaskRunner::instance();
  REQUIRE(drainsWithin(runner, 2000ms));

  for (int i = 0; i < 64; ++i) {
    runner.async([]() {}).get();
    // Give the finished flag time to land before the next async() prunes
    std::this_thread::sleep_for(1ms);
  }
  // Without reclamation every one of the 64 threads would still be held
  CHECK(runner.threadCount() < 64);
  CHECK(drainsWithin(runner, 2000ms));
}
