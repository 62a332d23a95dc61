#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/project_record.hpp"
#include "internal/db/model/usage_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace plancast::db {

/*
  Repository abstraction.

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id and writes it back into the record
  - usage_logs is append-only: there is no update or delete

  The DB is the source of truth for project lifecycle and usage.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Users
  // ---------------------------------------------------------------------

  virtual Result InsertUser(Transaction&, model::UserRecord&) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, uint64_t id) = 0;

  // Writes tier, flags and updated_at_ms only.
  virtual Result UpdateUser(Transaction&, const model::UserRecord&) = 0;

  // ---------------------------------------------------------------------
  // Projects
  // ---------------------------------------------------------------------

  virtual Result InsertProject(Transaction&, model::ProjectRecord&) = 0;

  virtual std::optional<model::ProjectRecord> GetProject(Transaction&, uint64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::ProjectRecord> ListProjectsByUser(Transaction&, uint64_t user_id) = 0;

  // Writes the lifecycle columns only; owner and input descriptor are immutable.
  virtual Result UpdateProject(Transaction&, const model::ProjectRecord&) = 0;

  // ---------------------------------------------------------------------
  // Usage ledger
  // ---------------------------------------------------------------------

  virtual Result AppendUsage(Transaction&, model::UsageRecord&) = 0;

  // Entries with created_at_ms >= since_ms, ordered by id.
  virtual std::vector<model::UsageRecord> ListUsage(Transaction&, uint64_t user_id, uint64_t since_ms) = 0;

  virtual model::UsageAggregate SumUsage(Transaction&, uint64_t user_id, const std::string& action_type, uint64_t since_ms) = 0;
};

} // namespace plancast::db
