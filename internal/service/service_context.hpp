#pragma once

#include <memory>

namespace plancast::core {
class ProjectStateMachine;
class UserRegistry;
} // namespace plancast::core
namespace plancast::pipeline {
class RunScheduler;
}
namespace plancast::quota {
class QuotaGate;
}
namespace plancast::usage {
class UsageLedger;
}

namespace plancast::service {

/*
  Dependency container shared by the service layer.
*/
struct ServiceContext {
  std::shared_ptr<plancast::core::UserRegistry>        users;
  std::shared_ptr<plancast::core::ProjectStateMachine> projects;
  std::shared_ptr<plancast::pipeline::RunScheduler>    scheduler;
  std::shared_ptr<plancast::quota::QuotaGate>          quota;
  std::shared_ptr<plancast::usage::UsageLedger>        ledger;

  // Append an api_call usage entry for every successful user-scoped call.
  bool record_api_calls = false;
};

} // namespace plancast::service
