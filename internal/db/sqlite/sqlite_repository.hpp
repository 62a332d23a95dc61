#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace plancast::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace plancast::db::sqlite
