#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::usage {

/*
  Append-only record of billable actions per user.

  Entries are never updated or deleted. Period queries cover
  [now - window, now].
*/
class UsageLedger {
 public:
  explicit UsageLedger(std::shared_ptr<db::Repository> repository);

  // Own transaction. Missing created_at defaults to now.
  plancast::v1::UsageEntry Append(const plancast::v1::UsageEntry& entry);

  // Caller's transaction; nothing is visible until it commits.
  plancast::v1::UsageEntry Append(db::Transaction& tx, const plancast::v1::UsageEntry& entry);

  plancast::v1::UsageTotals SumForPeriod(uint64_t user_id, plancast::v1::UsageAction action, std::chrono::hours window);
  plancast::v1::UsageTotals SumForPeriod(db::Transaction& tx, uint64_t user_id, plancast::v1::UsageAction action, std::chrono::hours window);

  // Totals for every action; tier limits are left for the caller.
  plancast::v1::UsageSummary Summary(uint64_t user_id, std::chrono::hours window);

  std::vector<plancast::v1::UsageEntry> List(uint64_t user_id, std::chrono::hours window);

 private:
  static uint64_t SinceMillis(std::chrono::hours window);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace plancast::usage
