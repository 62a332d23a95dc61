#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace plancast::db::sqlite {

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Reads return empty results on failure in the Result-less API, so a
// statement that cannot be prepared is a programming error: throw.
Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL (api_key must stay UNIQUE-but-optional).
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// Zero timestamps/ids are stored as NULL.
void BindOptU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

model::UserRecord ReadUser(sqlite3_stmt* st) {
  model::UserRecord r;
  r.id                = ColU64(st, 0);
  r.email             = ColText(st, 1);
  r.subscription_tier = ColText(st, 2);
  r.api_key           = ColText(st, 3);
  r.is_active         = ColBool(st, 4);
  r.is_verified       = ColBool(st, 5);
  r.created_at_ms     = ColU64(st, 6);
  r.updated_at_ms     = ColU64(st, 7);
  return r;
}

model::ProjectRecord ReadProject(sqlite3_stmt* st) {
  model::ProjectRecord r;
  r.id                       = ColU64(st, 0);
  r.user_id                  = ColU64(st, 1);
  r.filename                 = ColText(st, 2);
  r.original_filename        = ColText(st, 3);
  r.input_file_path          = ColText(st, 4);
  r.file_size_mb             = ColDouble(st, 5);
  r.file_format              = ColText(st, 6);
  r.scale_reference_json     = ColText(st, 7);
  r.status                   = ColText(st, 8);
  r.current_step             = ColText(st, 9);
  r.progress_percent         = static_cast<uint32_t>(sqlite3_column_int(st, 10));
  r.output_files_json        = ColText(st, 11);
  r.processing_metadata_json = ColText(st, 12);
  r.error_message            = ColText(st, 13);
  r.created_at_ms            = ColU64(st, 14);
  r.updated_at_ms            = ColU64(st, 15);
  r.started_at_ms            = ColU64(st, 16);
  r.completed_at_ms          = ColU64(st, 17);
  return r;
}

model::UsageRecord ReadUsage(sqlite3_stmt* st) {
  model::UsageRecord r;
  r.id      = ColU64(st, 0);
  r.user_id = ColU64(st, 1);
  if (sqlite3_column_type(st, 2) != SQLITE_NULL) {
    r.project_id = ColU64(st, 2);
  }
  r.action_type             = ColText(st, 3);
  r.api_endpoint            = ColText(st, 4);
  r.file_size_mb            = ColDouble(st, 5);
  r.processing_time_seconds = ColDouble(st, 6);
  r.request_metadata_json   = ColText(st, 7);
  r.created_at_ms           = ColU64(st, 8);
  if (r.request_metadata_json.empty()) r.request_metadata_json = "{}";
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_USER);

  BindText(st.get(), 1, r.email);
  BindText(st.get(), 2, r.subscription_tier);
  BindOptText(st.get(), 3, r.api_key);
  BindBool(st.get(), 4, r.is_active);
  BindBool(st.get(), 5, r.is_verified);
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.updated_at_ms);

  Result res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, uint64_t id) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_USER);
  BindU64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadUser(st.get());
}

Result SqliteRepository::UpdateUser(Transaction& t, const model::UserRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_USER);

  BindText(st.get(), 1, r.subscription_tier);
  BindBool(st.get(), 2, r.is_active);
  BindBool(st.get(), 3, r.is_verified);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindU64(st.get(), 5, r.id);

  Result res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return res;
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result SqliteRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_PROJECT);

  BindU64(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.filename);
  BindText(st.get(), 3, r.original_filename);
  BindText(st.get(), 4, r.input_file_path);
  BindDouble(st.get(), 5, r.file_size_mb);
  BindText(st.get(), 6, r.file_format);
  BindOptText(st.get(), 7, r.scale_reference_json);
  BindText(st.get(), 8, r.status);
  BindText(st.get(), 9, r.current_step);
  sqlite3_bind_int(st.get(), 10, static_cast<int>(r.progress_percent));
  BindText(st.get(), 11, r.output_files_json);
  BindText(st.get(), 12, r.processing_metadata_json);
  BindOptText(st.get(), 13, r.error_message);
  BindU64(st.get(), 14, r.created_at_ms);
  BindU64(st.get(), 15, r.updated_at_ms);
  BindOptU64(st.get(), 16, r.started_at_ms);
  BindOptU64(st.get(), 17, r.completed_at_ms);

  Result res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::optional<model::ProjectRecord> SqliteRepository::GetProject(Transaction& t, uint64_t id) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_PROJECT);
  BindU64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadProject(st.get());
}

std::vector<model::ProjectRecord> SqliteRepository::ListProjectsByUser(Transaction& t, uint64_t user_id) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_PROJECTS_BY_USER);
  BindU64(st.get(), 1, user_id);

  std::vector<model::ProjectRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadProject(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_PROJECT);

  BindText(st.get(), 1, r.status);
  BindText(st.get(), 2, r.current_step);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(r.progress_percent));
  BindText(st.get(), 4, r.output_files_json);
  BindText(st.get(), 5, r.processing_metadata_json);
  BindOptText(st.get(), 6, r.error_message);
  BindU64(st.get(), 7, r.updated_at_ms);
  BindOptU64(st.get(), 8, r.started_at_ms);
  BindOptU64(st.get(), 9, r.completed_at_ms);
  BindU64(st.get(), 10, r.id);

  Result res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return res;
}

// ------------------------------------------------------------------
// Usage ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendUsage(Transaction& t, model::UsageRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_USAGE);

  BindU64(st.get(), 1, r.user_id);
  if (r.project_id) {
    BindU64(st.get(), 2, *r.project_id);
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  BindText(st.get(), 3, r.action_type);
  BindOptText(st.get(), 4, r.api_endpoint);
  BindDouble(st.get(), 5, r.file_size_mb);
  BindDouble(st.get(), 6, r.processing_time_seconds);
  BindText(st.get(), 7, r.request_metadata_json);
  BindU64(st.get(), 8, r.created_at_ms);

  Result res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::UsageRecord> SqliteRepository::ListUsage(Transaction& t, uint64_t user_id, uint64_t since_ms) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_USAGE_SINCE);
  BindU64(st.get(), 1, user_id);
  BindU64(st.get(), 2, since_ms);

  std::vector<model::UsageRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadUsage(st.get()));
  }
  return out;
}

model::UsageAggregate SqliteRepository::SumUsage(Transaction& t, uint64_t user_id, const std::string& action_type, uint64_t since_ms) {
  auto st = Prepare(TX(t).Handle(), sql::SUM_USAGE);
  BindU64(st.get(), 1, user_id);
  BindText(st.get(), 2, action_type);
  BindU64(st.get(), 3, since_ms);

  model::UsageAggregate agg;
  if (sqlite3_step(st.get()) == SQLITE_ROW) {
    agg.count                   = ColU64(st.get(), 0);
    agg.file_size_mb            = ColDouble(st.get(), 1);
    agg.processing_time_seconds = ColDouble(st.get(), 2);
  }
  return agg;
}

} // namespace plancast::db::sqlite
