#include "memory_repository.hpp"


#include "memory_tx.hpp"

namespace plancast::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result MemoryRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.users) {
    if (existing.email == r.email) {
      return Result::Err(ErrorCode::AlreadyExists, "email already registered");
    }
    if (!r.api_key.empty() && existing.api_key == r.api_key) {
      return Result::Err(ErrorCode::AlreadyExists, "api key already registered");
    }
  }
  r.id          = s.next_user_id++;
  s.users[r.id] = r;
  return Result::Ok();
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateUser(Transaction& t, const model::UserRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.users.find(r.id);
  if (it == s.users.end()) return Result::Err(ErrorCode::NotFound);
  it->second.subscription_tier = r.subscription_tier;
  it->second.is_active         = r.is_active;
  it->second.is_verified       = r.is_verified;
  it->second.updated_at_ms     = r.updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result MemoryRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.users.contains(r.user_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "project owner does not exist");
  }
  r.id             = s.next_project_id++;
  s.projects[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProjectRecord> MemoryRepository::GetProject(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.projects.find(id);
  if (it == s.projects.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProjectRecord> MemoryRepository::ListProjectsByUser(Transaction& t, uint64_t user_id) {
  std::vector<model::ProjectRecord> out;
  for (const auto& [_, record] : TX(t).View().projects) {
    if (record.user_id == user_id) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.projects.find(r.id);
  if (it == s.projects.end()) return Result::Err(ErrorCode::NotFound);

  auto& stored                    = it->second;
  stored.status                   = r.status;
  stored.current_step             = r.current_step;
  stored.progress_percent         = r.progress_percent;
  stored.output_files_json        = r.output_files_json;
  stored.processing_metadata_json = r.processing_metadata_json;
  stored.error_message            = r.error_message;
  stored.updated_at_ms            = r.updated_at_ms;
  stored.started_at_ms            = r.started_at_ms;
  stored.completed_at_ms          = r.completed_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Usage
// ------------------------------------------------------------------

Result MemoryRepository::AppendUsage(Transaction& t, model::UsageRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.users.contains(r.user_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "usage owner does not exist");
  }
  r.id = s.next_usage_id++;
  s.usage.push_back(r);
  return Result::Ok();
}

std::vector<model::UsageRecord> MemoryRepository::ListUsage(Transaction& t, uint64_t user_id, uint64_t since_ms) {
  std::vector<model::UsageRecord> out;
  for (const auto& e : TX(t).View().usage) {
    if (e.user_id == user_id && e.created_at_ms >= since_ms) out.push_back(e);
  }
  return out;
}

model::UsageAggregate MemoryRepository::SumUsage(Transaction& t, uint64_t user_id, const std::string& action_type, uint64_t since_ms) {
  model::UsageAggregate total;
  for (const auto& e : TX(t).View().usage) {
    if (e.user_id != user_id || e.action_type != action_type || e.created_at_ms < since_ms) continue;
    ++total.count;
    total.file_size_mb += e.file_size_mb;
    total.processing_time_seconds += e.processing_time_seconds;
  }
  return total;
}

} // namespace plancast::db::memory
