#include "veritree/fork_join.hpp"
#include "veritree/logger.h"
#include <algorithm>
#include <string>

namespace veritree {

ForkJoinPool::ForkJoinPool(size_t workers) {
  size_t background = workers > 1 ? workers - 1 : 0;
  threads_.reserve(background);
  for (size_t i = 0; i < background; ++i) {
    threads_.emplace_back(&ForkJoinPool::workerLoop, this);
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "ForkJoinPool started with " +
                                std::to_string(background + 1) + " workers");
}

ForkJoinPool::~ForkJoinPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  queueCv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
}

ForkJoinPool::TaskHandle ForkJoinPool::submit(std::function<void()> fn) {
  auto task = std::make_shared<Task>(std::move(fn));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(task);
  }
  queueCv_.notify_one();
  return task;
}

bool ForkJoinPool::takeBack(const TaskHandle &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (task->state_ != Task::State::Queued) {
    return false;
  }
  // The owner's most recent fork is usually at the back.
  auto it = std::find(queue_.rbegin(), queue_.rend(), task);
  if (it != queue_.rend()) {
    queue_.erase(std::next(it).base());
  }
  task->state_ = Task::State::Running;
  return true;
}

void ForkJoinPool::runTask(const TaskHandle &task) {
  std::exception_ptr error;
  try {
    task->fn_();
  } catch (...) {
    error = std::current_exception(); // handed to the joiner
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task->error_ = error;
    task->state_ = Task::State::Done;
    task->fn_ = nullptr;
  }
  doneCv_.notify_all();
}

void ForkJoinPool::waitDone(const TaskHandle &task) {
  std::unique_lock<std::mutex> lock(mutex_);
  doneCv_.wait(lock, [&] { return task->state_ == Task::State::Done; });
}

void ForkJoinPool::join(const TaskHandle &task) {
  if (takeBack(task)) {
    runTask(task);
  } else {
    waitDone(task);
  }
  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error = task->error_;
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

void ForkJoinPool::cancel(const TaskHandle &task) {
  if (takeBack(task)) {
    std::lock_guard<std::mutex> lock(mutex_);
    task->state_ = Task::State::Done;
    task->fn_ = nullptr;
    return;
  }
  waitDone(task);
}

void ForkJoinPool::workerLoop() {
  while (true) {
    TaskHandle task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queueCv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) {
        return;
      }
      task = queue_.front();
      queue_.pop_front();
      task->state_ = Task::State::Running;
    }
    runTask(task);
  }
}

} // namespace veritree
