#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace plancast::db::postgres {

namespace {

#define PG_PROJECT_COLUMNS                                                                                                  \
  "id,user_id,filename,original_filename,input_file_path,file_size_mb,file_format,COALESCE(scale_reference::text,''),"    \
  "status,current_step,progress_percent,output_files::text,processing_metadata::text,COALESCE(error_message,'')," \
  "created_at_ms,updated_at_ms,COALESCE(started_at_ms,0),COALESCE(completed_at_ms,0)"

constexpr const char* kProjectColumns = PG_PROJECT_COLUMNS;

#undef PG_PROJECT_COLUMNS

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(std::move(conn));
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard relock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(std::move(conn));
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* statement : sql::kPostgresSchema) {
    tx.exec(statement);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string project_columns = kProjectColumns;

  // users
  conn.prepare("insert_user",
               "INSERT INTO users(email,subscription_tier,api_key,is_active,is_verified,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");
  conn.prepare("get_user",
               "SELECT id,email,subscription_tier,COALESCE(api_key,''),is_active,is_verified,created_at_ms,updated_at_ms "
               "FROM users WHERE id=$1");
  conn.prepare("update_user", "UPDATE users SET subscription_tier=$2,is_active=$3,is_verified=$4,updated_at_ms=$5 WHERE id=$1");

  // projects
  conn.prepare("insert_project",
               "INSERT INTO projects(user_id,filename,original_filename,input_file_path,file_size_mb,file_format,scale_reference,"
               "status,current_step,progress_percent,output_files,processing_metadata,error_message,"
               "created_at_ms,updated_at_ms,started_at_ms,completed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10,$11::jsonb,$12::jsonb,$13,$14,$15,$16,$17) RETURNING id");
  conn.prepare("get_project", "SELECT " + project_columns + " FROM projects WHERE id=$1");
  conn.prepare("list_projects_by_user", "SELECT " + project_columns + " FROM projects WHERE user_id=$1 ORDER BY id");
  conn.prepare("update_project",
               "UPDATE projects SET status=$2,current_step=$3,progress_percent=$4,output_files=$5::jsonb,"
               "processing_metadata=$6::jsonb,error_message=$7,updated_at_ms=$8,started_at_ms=$9,completed_at_ms=$10 "
               "WHERE id=$1");

  // usage
  conn.prepare("insert_usage",
               "INSERT INTO usage_logs(user_id,project_id,action_type,api_endpoint,file_size_mb,processing_time_seconds,"
               "request_metadata,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8) RETURNING id");
  conn.prepare("list_usage",
               "SELECT id,user_id,project_id,action_type,COALESCE(api_endpoint,''),COALESCE(file_size_mb,0),"
               "COALESCE(processing_time_seconds,0),COALESCE(request_metadata::text,'{}'),created_at_ms "
               "FROM usage_logs WHERE user_id=$1 AND created_at_ms>=$2 ORDER BY id");
  conn.prepare("sum_usage",
               "SELECT COUNT(*),COALESCE(SUM(file_size_mb),0),COALESCE(SUM(processing_time_seconds),0) "
               "FROM usage_logs WHERE user_id=$1 AND action_type=$2 AND created_at_ms>=$3");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace plancast::db::postgres
