#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace plancast::lease {

class RunLeaseTable;

/*
  Exclusive right to run one project's pipeline.

  Move-only. Released when destroyed; the table may already be gone,
  in which case release is a no-op.
*/
class RunLease {
 public:
  RunLease() = default;
  ~RunLease();

  RunLease(RunLease&& other) noexcept;
  RunLease& operator=(RunLease&& other) noexcept;

  RunLease(const RunLease&)            = delete;
  RunLease& operator=(const RunLease&) = delete;

  uint64_t project_id() const {
    return project_id_;
  }

  const std::string& token() const {
    return token_;
  }

  bool valid() const {
    return !token_.empty();
  }

  void Release();

 private:
  friend class RunLeaseTable;

  RunLease(std::weak_ptr<RunLeaseTable> table, uint64_t project_id, std::string token);

  std::weak_ptr<RunLeaseTable> table_;
  uint64_t                     project_id_ = 0;
  std::string                  token_;
};

/*
  At most one live RunLease per project id.

  Must be owned by a shared_ptr (leases hold a weak reference back).
*/
class RunLeaseTable : public std::enable_shared_from_this<RunLeaseTable> {
 public:
  static std::shared_ptr<RunLeaseTable> Create();

  // Throws util::AlreadyRunning if the project already holds a lease.
  RunLease Acquire(uint64_t project_id);

  bool        IsHeld(uint64_t project_id) const;
  std::size_t ActiveCount() const;

 private:
  friend class RunLease;

  RunLeaseTable() = default;

  void Remove(uint64_t project_id, const std::string& token);

  mutable std::mutex                        mutex_;
  std::unordered_map<uint64_t, std::string> held_;
};

} // namespace plancast::lease
