#pragma once

namespace plancast::db::sql {

/*
  SQLite statements. Postgres prepares its own $n-numbered variants in
  PgPool::PrepareStatements.
*/

// users

static constexpr const char* INSERT_USER =
    "INSERT INTO users(email,subscription_tier,api_key,is_active,is_verified,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_USER =
    "SELECT id,email,subscription_tier,api_key,is_active,is_verified,created_at_ms,updated_at_ms"
    " FROM users WHERE id=?;";

static constexpr const char* UPDATE_USER =
    "UPDATE users SET subscription_tier=?,is_active=?,is_verified=?,updated_at_ms=?"
    " WHERE id=?;";

// projects

#define PLANCAST_PROJECT_COLUMNS                                                                         \
  "id,user_id,filename,original_filename,input_file_path,file_size_mb,file_format,scale_reference," \
  "status,current_step,progress_percent,output_files,processing_metadata,error_message,"             \
  "created_at_ms,updated_at_ms,started_at_ms,completed_at_ms"

static constexpr const char* INSERT_PROJECT =
    "INSERT INTO projects(user_id,filename,original_filename,input_file_path,file_size_mb,file_format,scale_reference,"
    "status,current_step,progress_percent,output_files,processing_metadata,error_message,"
    "created_at_ms,updated_at_ms,started_at_ms,completed_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PROJECT = "SELECT " PLANCAST_PROJECT_COLUMNS " FROM projects WHERE id=?;";

static constexpr const char* SELECT_PROJECTS_BY_USER = "SELECT " PLANCAST_PROJECT_COLUMNS " FROM projects WHERE user_id=? ORDER BY id;";

static constexpr const char* UPDATE_PROJECT =
    "UPDATE projects SET status=?,current_step=?,progress_percent=?,output_files=?,processing_metadata=?,"
    "error_message=?,updated_at_ms=?,started_at_ms=?,completed_at_ms=?"
    " WHERE id=?;";

#undef PLANCAST_PROJECT_COLUMNS

// usage

static constexpr const char* INSERT_USAGE =
    "INSERT INTO usage_logs(user_id,project_id,action_type,api_endpoint,file_size_mb,processing_time_seconds,"
    "request_metadata,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_USAGE_SINCE =
    "SELECT id,user_id,project_id,action_type,api_endpoint,file_size_mb,processing_time_seconds,"
    "request_metadata,created_at_ms"
    " FROM usage_logs WHERE user_id=? AND created_at_ms>=? ORDER BY id;";

static constexpr const char* SUM_USAGE =
    "SELECT COUNT(*),COALESCE(SUM(file_size_mb),0),COALESCE(SUM(processing_time_seconds),0)"
    " FROM usage_logs WHERE user_id=? AND action_type=? AND created_at_ms>=?;";

} // namespace plancast::db::sql
