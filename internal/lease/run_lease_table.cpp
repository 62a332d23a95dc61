#include "run_lease_table.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace plancast::lease {

RunLease::RunLease(std::weak_ptr<RunLeaseTable> table, uint64_t project_id, std::string token)
    : table_(std::move(table)), project_id_(project_id), token_(std::move(token)) {}

RunLease::~RunLease() {
  Release();
}

RunLease::RunLease(RunLease&& other) noexcept
    : table_(std::move(other.table_)), project_id_(other.project_id_), token_(std::move(other.token_)) {
  other.token_.clear();
}

RunLease& RunLease::operator=(RunLease&& other) noexcept {
  if (this != &other) {
    Release();
    table_      = std::move(other.table_);
    project_id_ = other.project_id_;
    token_      = std::move(other.token_);
    other.token_.clear();
  }
  return *this;
}

void RunLease::Release() {
  if (token_.empty()) return;
  if (auto table = table_.lock()) {
    table->Remove(project_id_, token_);
  }
  token_.clear();
  table_.reset();
}

std::shared_ptr<RunLeaseTable> RunLeaseTable::Create() {
  return std::shared_ptr<RunLeaseTable>(new RunLeaseTable());
}

RunLease RunLeaseTable::Acquire(uint64_t project_id) {
  std::lock_guard lock(mutex_);

  if (held_.contains(project_id)) {
    throw util::AlreadyRunning("project " + std::to_string(project_id) + " is already running");
  }

  auto token        = util::GenerateToken();
  held_[project_id]  = token;
  return RunLease(weak_from_this(), project_id, std::move(token));
}

bool RunLeaseTable::IsHeld(uint64_t project_id) const {
  std::lock_guard lock(mutex_);
  return held_.contains(project_id);
}

std::size_t RunLeaseTable::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

void RunLeaseTable::Remove(uint64_t project_id, const std::string& token) {
  std::lock_guard lock(mutex_);

  // A stale token must not release a newer holder's lease.
  auto it = held_.find(project_id);
  if (it != held_.end() && it->second == token) {
    held_.erase(it);
  }
}

} // namespace plancast::lease
