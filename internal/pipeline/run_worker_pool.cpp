#include "run_worker_pool.hpp"

#include <stdexcept>

#include "internal/core/project_state_machine.hpp"
#include "internal/observability/logging.hpp"

namespace plancast::pipeline {

using plancast::observability::IntField;
using plancast::observability::StringField;

RunWorkerPool::RunWorkerPool(std::shared_ptr<RunScheduler> scheduler, std::shared_ptr<core::ProjectStateMachine> machine, std::size_t workers)
    : scheduler_(std::move(scheduler)), machine_(std::move(machine)), worker_count_(workers == 0 ? 1 : workers) {
  if (!scheduler_ || !machine_) {
    throw std::invalid_argument("run worker pool requires a scheduler and a state machine");
  }
}

RunWorkerPool::~RunWorkerPool() {
  Stop();
}

void RunWorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&RunWorkerPool::Run, this, i);
  }
  PLANCAST_LOG_INFO("run workers started", {IntField("workers", static_cast<int64_t>(worker_count_))});
}

void RunWorkerPool::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void RunWorkerPool::Run(std::size_t index) {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    const auto project_id = task->ticket.project_id();
    try {
      const auto snapshot = machine_->Execute(std::move(task->ticket));
      PLANCAST_LOG_DEBUG("run finished", {IntField("worker", static_cast<int64_t>(index)), IntField("project_id", static_cast<int64_t>(project_id)),
                                          IntField("status", static_cast<int64_t>(snapshot.status()))});
    } catch (const std::exception& e) {
      PLANCAST_LOG_ERROR("run failed outside a stage", {IntField("worker", static_cast<int64_t>(index)),
                                                        IntField("project_id", static_cast<int64_t>(project_id)), StringField("error", e.what())});
    }
  }
}

} // namespace plancast::pipeline
