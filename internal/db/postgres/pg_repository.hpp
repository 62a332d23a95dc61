#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace plancast::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace plancast::db::postgres
