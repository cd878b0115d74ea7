#ifndef VERITREE_FORK_JOIN_HPP
#define VERITREE_FORK_JOIN_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace veritree {

/**
 * @brief Fork/join worker pool for subtree hashing.
 *
 * A caller forks a task with submit() and later join()s it. If no worker has
 * picked the task up by then, the caller takes it back and runs it inline,
 * otherwise it waits for the worker. Idle workers take the oldest queued
 * task, which is the largest pending subtree when tasks are forked top-down.
 *
 * Joining never runs unrelated tasks, so the call stack of a thread grows
 * only along one root-to-leaf path of the tree.
 */
class ForkJoinPool {
public:
  class Task;
  using TaskHandle = std::shared_ptr<Task>;

  /**
   * @param workers Total parallelism including the calling thread; the pool
   *        starts workers - 1 background threads.
   */
  explicit ForkJoinPool(size_t workers);
  ~ForkJoinPool();

  ForkJoinPool(const ForkJoinPool &) = delete;
  ForkJoinPool &operator=(const ForkJoinPool &) = delete;

  /** Queue @p fn for execution by any worker. */
  TaskHandle submit(std::function<void()> fn);

  /**
   * @brief Wait for @p task, running it inline if nobody started it.
   * @throw Rethrows the exception the task exited with.
   */
  void join(const TaskHandle &task);

  /**
   * @brief Drop @p task if still queued, otherwise wait for it to finish.
   *
   * Used on the error path so that no task outlives the data it references.
   * Any exception of the task is discarded: the caller already propagates
   * the first error.
   */
  void cancel(const TaskHandle &task);

  size_t workers() const { return threads_.size() + 1; }

private:
  void workerLoop();
  // Removes @p task from the queue; false if a worker already took it.
  bool takeBack(const TaskHandle &task);
  void runTask(const TaskHandle &task);
  void waitDone(const TaskHandle &task);

  std::mutex mutex_;
  std::condition_variable queueCv_;
  std::condition_variable doneCv_;
  std::deque<TaskHandle> queue_;
  std::vector<std::thread> threads_;
  bool stopping_{false};
};

class ForkJoinPool::Task {
public:
  explicit Task(std::function<void()> fn) : fn_(std::move(fn)) {}

private:
  friend class ForkJoinPool;
  enum class State { Queued, Running, Done };

  std::function<void()> fn_;
  State state_{State::Queued};
  std::exception_ptr error_;
};

} // namespace veritree

#endif // VERITREE_FORK_JOIN_HPP
