#include "run_scheduler.hpp"

#include "internal/util/errors.hpp"

namespace plancast::pipeline {

void RunScheduler::Enqueue(RunTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw util::Unavailable("run scheduler is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<RunTask> RunScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  RunTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void RunScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t RunScheduler::Pending() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace plancast::pipeline
