#pragma once

#include <array>

namespace plancast::db::sql {

/*
  Idempotent schema bootstrap, applied at start-up.

  Column names follow the original PlanCast tables; timestamps are
  unix milliseconds, JSON mappings are TEXT (sqlite) / JSONB (postgres).
*/

inline constexpr std::array<const char*, 6> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS users ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " email TEXT NOT NULL UNIQUE,"
    " subscription_tier TEXT NOT NULL DEFAULT 'free',"
    " api_key TEXT UNIQUE,"
    " is_active INTEGER NOT NULL DEFAULT 1,"
    " is_verified INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS projects ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " filename TEXT NOT NULL,"
    " original_filename TEXT NOT NULL,"
    " input_file_path TEXT NOT NULL,"
    " file_size_mb REAL NOT NULL,"
    " file_format TEXT NOT NULL,"
    " scale_reference TEXT,"
    " status TEXT NOT NULL DEFAULT 'pending',"
    " current_step TEXT NOT NULL,"
    " progress_percent INTEGER NOT NULL DEFAULT 0 CHECK (progress_percent BETWEEN 0 AND 100),"
    " output_files TEXT NOT NULL DEFAULT '{}',"
    " processing_metadata TEXT NOT NULL DEFAULT '{}',"
    " error_message TEXT,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " started_at_ms INTEGER,"
    " completed_at_ms INTEGER);",

    "CREATE INDEX IF NOT EXISTS idx_projects_user ON projects(user_id);",

    "CREATE TABLE IF NOT EXISTS usage_logs ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " project_id INTEGER REFERENCES projects(id) ON DELETE SET NULL,"
    " action_type TEXT NOT NULL,"
    " api_endpoint TEXT,"
    " file_size_mb REAL,"
    " processing_time_seconds REAL,"
    " request_metadata TEXT,"
    " created_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_usage_user_action ON usage_logs(user_id, action_type, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS idx_usage_project ON usage_logs(project_id);",
};

inline constexpr std::array<const char*, 6> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS users ("
    " id BIGSERIAL PRIMARY KEY,"
    " email TEXT NOT NULL UNIQUE,"
    " subscription_tier TEXT NOT NULL DEFAULT 'free',"
    " api_key TEXT UNIQUE,"
    " is_active BOOLEAN NOT NULL DEFAULT TRUE,"
    " is_verified BOOLEAN NOT NULL DEFAULT FALSE,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS projects ("
    " id BIGSERIAL PRIMARY KEY,"
    " user_id BIGINT NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " filename TEXT NOT NULL,"
    " original_filename TEXT NOT NULL,"
    " input_file_path TEXT NOT NULL,"
    " file_size_mb DOUBLE PRECISION NOT NULL,"
    " file_format TEXT NOT NULL,"
    " scale_reference JSONB,"
    " status TEXT NOT NULL DEFAULT 'pending',"
    " current_step TEXT NOT NULL,"
    " progress_percent INTEGER NOT NULL DEFAULT 0 CHECK (progress_percent BETWEEN 0 AND 100),"
    " output_files JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " processing_metadata JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " error_message TEXT,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " started_at_ms BIGINT,"
    " completed_at_ms BIGINT);",

    "CREATE INDEX IF NOT EXISTS idx_projects_user ON projects(user_id);",

    "CREATE TABLE IF NOT EXISTS usage_logs ("
    " id BIGSERIAL PRIMARY KEY,"
    " user_id BIGINT NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " project_id BIGINT REFERENCES projects(id) ON DELETE SET NULL,"
    " action_type TEXT NOT NULL,"
    " api_endpoint TEXT,"
    " file_size_mb DOUBLE PRECISION,"
    " processing_time_seconds DOUBLE PRECISION,"
    " request_metadata JSONB,"
    " created_at_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_usage_user_action ON usage_logs(user_id, action_type, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS idx_usage_project ON usage_logs(project_id);",
};

} // namespace plancast::db::sql
