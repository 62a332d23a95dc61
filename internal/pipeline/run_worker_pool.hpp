#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "run_scheduler.hpp"

namespace plancast::core {
class ProjectStateMachine;
}

namespace plancast::pipeline {

/*
  Background workers that execute queued pipeline runs.

  Stage failures are recorded on the project by the state machine; the
  pool only logs what escapes it (storage errors, a vanished project).
*/
class RunWorkerPool {
 public:
  RunWorkerPool(std::shared_ptr<RunScheduler> scheduler, std::shared_ptr<core::ProjectStateMachine> machine, std::size_t workers);
  ~RunWorkerPool();

  void Start();

  // Drains the queue, then joins every worker.
  void Stop();

  std::size_t size() const {
    return worker_count_;
  }

 private:
  void Run(std::size_t index);

  std::shared_ptr<RunScheduler>              scheduler_;
  std::shared_ptr<core::ProjectStateMachine> machine_;
  std::size_t                                worker_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace plancast::pipeline
