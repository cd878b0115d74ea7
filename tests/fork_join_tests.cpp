#include "veritree/fork_join.hpp"
#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace veritree;

TEST(ForkJoinPool, InlineWhenSingleWorker) {
  ForkJoinPool pool(1);
  EXPECT_EQ(pool.workers(), 1u);
  int value = 0;
  auto task = pool.submit([&] { value = 42; });
  pool.join(task);
  EXPECT_EQ(value, 42);
}

TEST(ForkJoinPool, JoinRethrowsTaskError) {
  for (size_t workers : {1u, 4u}) {
    ForkJoinPool pool(workers);
    auto task = pool.submit([] { throw std::runtime_error("subtree failed"); });
    EXPECT_THROW(pool.join(task), std::runtime_error);
  }
}

TEST(ForkJoinPool, CancelDropsQueuedTask) {
  ForkJoinPool pool(1);
  bool ran = false;
  auto task = pool.submit([&] { ran = true; });
  pool.cancel(task);
  EXPECT_FALSE(ran);
}

TEST(ForkJoinPool, ManyTasksAllComplete) {
  ForkJoinPool pool(4);
  std::atomic<int> sum{0};
  std::vector<ForkJoinPool::TaskHandle> tasks;
  for (int i = 1; i <= 100; ++i) {
    tasks.push_back(pool.submit([&sum, i] { sum += i; }));
  }
  for (auto &t : tasks) {
    pool.join(t);
  }
  EXPECT_EQ(sum.load(), 5050);
}

TEST(ForkJoinPool, NestedForksDoNotDeadlock) {
  ForkJoinPool pool(2);
  std::atomic<int> leaves{0};
  std::function<void(int)> fork = [&](int depth) {
    if (depth == 0) {
      ++leaves;
      return;
    }
    auto right = pool.submit([&, depth] { fork(depth - 1); });
    fork(depth - 1);
    pool.join(right);
  };
  fork(8);
  EXPECT_EQ(leaves.load(), 256);
}
