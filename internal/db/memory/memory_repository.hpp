#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace plancast::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and the `memory` database config.

  Transactions are serialized: Begin() blocks until the previous
  transaction finishes, so commits never conflict.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertUser(Transaction&, model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, uint64_t id) override;
  Result                           UpdateUser(Transaction&, const model::UserRecord&) override;

  Result                              InsertProject(Transaction&, model::ProjectRecord&) override;
  std::optional<model::ProjectRecord> GetProject(Transaction&, uint64_t id) override;
  std::vector<model::ProjectRecord>   ListProjectsByUser(Transaction&, uint64_t user_id) override;
  Result                              UpdateProject(Transaction&, const model::ProjectRecord&) override;

  Result                          AppendUsage(Transaction&, model::UsageRecord&) override;
  std::vector<model::UsageRecord> ListUsage(Transaction&, uint64_t user_id, uint64_t since_ms) override;
  model::UsageAggregate           SumUsage(Transaction&, uint64_t user_id, const std::string& action_type, uint64_t since_ms) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::UserRecord>    users;
    std::map<uint64_t, model::ProjectRecord> projects;
    std::vector<model::UsageRecord>          usage;

    uint64_t next_user_id    = 1;
    uint64_t next_project_id = 1;
    uint64_t next_usage_id   = 1;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace plancast::db::memory
