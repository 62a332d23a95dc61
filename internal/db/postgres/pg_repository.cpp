#include "pg_repository.hpp"

namespace plancast::db::postgres {

namespace {

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<uint64_t> NullIfZero(uint64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

model::UserRecord ReadUser(const pqxx::row& row) {
  model::UserRecord r;
  r.id                = row[0].as<uint64_t>();
  r.email             = row[1].c_str();
  r.subscription_tier = row[2].c_str();
  r.api_key           = row[3].c_str();
  r.is_active         = row[4].as<bool>();
  r.is_verified       = row[5].as<bool>();
  r.created_at_ms     = row[6].as<uint64_t>();
  r.updated_at_ms     = row[7].as<uint64_t>();
  return r;
}

model::ProjectRecord ReadProject(const pqxx::row& row) {
  model::ProjectRecord r;
  r.id                       = row[0].as<uint64_t>();
  r.user_id                  = row[1].as<uint64_t>();
  r.filename                 = row[2].c_str();
  r.original_filename        = row[3].c_str();
  r.input_file_path          = row[4].c_str();
  r.file_size_mb             = row[5].as<double>();
  r.file_format              = row[6].c_str();
  r.scale_reference_json     = row[7].c_str();
  r.status                   = row[8].c_str();
  r.current_step             = row[9].c_str();
  r.progress_percent         = row[10].as<uint32_t>();
  r.output_files_json        = row[11].c_str();
  r.processing_metadata_json = row[12].c_str();
  r.error_message            = row[13].c_str();
  r.created_at_ms            = row[14].as<uint64_t>();
  r.updated_at_ms            = row[15].as<uint64_t>();
  r.started_at_ms            = row[16].as<uint64_t>();
  r.completed_at_ms          = row[17].as<uint64_t>();
  return r;
}

model::UsageRecord ReadUsage(const pqxx::row& row) {
  model::UsageRecord r;
  r.id      = row[0].as<uint64_t>();
  r.user_id = row[1].as<uint64_t>();
  if (!row[2].is_null()) {
    r.project_id = row[2].as<uint64_t>();
  }
  r.action_type             = row[3].c_str();
  r.api_endpoint            = row[4].c_str();
  r.file_size_mb            = row[5].as<double>();
  r.processing_time_seconds = row[6].as<double>();
  r.request_metadata_json   = row[7].c_str();
  r.created_at_ms           = row[8].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result PgRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared1("insert_user", r.email, r.subscription_tier, NullIfEmpty(r.api_key), r.is_active, r.is_verified,
                                           r.created_at_ms, r.updated_at_ms);
    r.id     = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_user", id);
  if (res.empty()) return std::nullopt;
  return ReadUser(res[0]);
}

Result PgRepository::UpdateUser(Transaction& t, const model::UserRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_user", r.id, r.subscription_tier, r.is_active, r.is_verified, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result PgRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared1("insert_project", r.user_id, r.filename, r.original_filename, r.input_file_path, r.file_size_mb,
                                           r.file_format, NullIfEmpty(r.scale_reference_json), r.status, r.current_step, r.progress_percent,
                                           r.output_files_json, r.processing_metadata_json, NullIfEmpty(r.error_message), r.created_at_ms,
                                           r.updated_at_ms, NullIfZero(r.started_at_ms), NullIfZero(r.completed_at_ms));
    r.id     = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProjectRecord> PgRepository::GetProject(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_project", id);
  if (res.empty()) return std::nullopt;
  return ReadProject(res[0]);
}

std::vector<model::ProjectRecord> PgRepository::ListProjectsByUser(Transaction& t, uint64_t user_id) {
  auto res = TX(t).Work().exec_prepared("list_projects_by_user", user_id);

  std::vector<model::ProjectRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadProject(row));
  }
  return out;
}

Result PgRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_project", r.id, r.status, r.current_step, r.progress_percent, r.output_files_json,
                                          r.processing_metadata_json, NullIfEmpty(r.error_message), r.updated_at_ms, NullIfZero(r.started_at_ms),
                                          NullIfZero(r.completed_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Usage ledger
// ------------------------------------------------------------------

Result PgRepository::AppendUsage(Transaction& t, model::UsageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared1("insert_usage", r.user_id, r.project_id, r.action_type, NullIfEmpty(r.api_endpoint), r.file_size_mb,
                                           r.processing_time_seconds, r.request_metadata_json, r.created_at_ms);
    r.id     = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UsageRecord> PgRepository::ListUsage(Transaction& t, uint64_t user_id, uint64_t since_ms) {
  auto res = TX(t).Work().exec_prepared("list_usage", user_id, since_ms);

  std::vector<model::UsageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadUsage(row));
  }
  return out;
}

model::UsageAggregate PgRepository::SumUsage(Transaction& t, uint64_t user_id, const std::string& action_type, uint64_t since_ms) {
  auto row = TX(t).Work().exec_prepared1("sum_usage", user_id, action_type, since_ms);

  model::UsageAggregate agg;
  agg.count                   = row[0].as<uint64_t>();
  agg.file_size_mb            = row[1].as<double>();
  agg.processing_time_seconds = row[2].as<double>();
  return agg;
}

} // namespace plancast::db::postgres
