#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "run_task.hpp"

namespace plancast::pipeline {

/*
  Thread-safe blocking queue for run workers.

  After Shutdown, Enqueue throws util::Unavailable and Dequeue drains
  what is left before returning nullopt.
*/
class RunScheduler {
 public:
  void Enqueue(RunTask task);

  // blocking wait
  std::optional<RunTask> Dequeue();

  void Shutdown();

  std::size_t Pending();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<RunTask>     queue_;
  bool                    shutdown_ = false;
};

} // namespace plancast::pipeline
