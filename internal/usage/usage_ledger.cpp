#include "usage_ledger.hpp"

#include "internal/core/db_error.hpp"
#include "internal/core/record_codec.hpp"
#include "internal/model/usage_action.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace plancast::usage {

using plancast::v1::UsageAction;
using plancast::v1::UsageEntry;
using plancast::v1::UsageSummary;
using plancast::v1::UsageTotals;

UsageLedger::UsageLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {}

uint64_t UsageLedger::SinceMillis(std::chrono::hours window) {
  const uint64_t now       = util::ToUnixMillis(util::Now());
  const uint64_t window_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(window).count());
  return window_ms >= now ? 0 : now - window_ms;
}

UsageEntry UsageLedger::Append(const UsageEntry& entry) {
  auto tx     = repository_->Begin();
  auto stored = Append(*tx, entry);
  tx->Commit();
  return stored;
}

UsageEntry UsageLedger::Append(db::Transaction& tx, const UsageEntry& entry) {
  if (entry.user_id() == 0) {
    throw util::InvalidInput("usage entry: user id is required");
  }
  if (entry.action() == plancast::v1::USAGE_ACTION_UNSPECIFIED) {
    throw util::InvalidInput("usage entry: action is required");
  }

  auto record = core::ToRecord(entry);
  if (record.created_at_ms == 0) {
    record.created_at_ms = util::ToUnixMillis(util::Now());
  }

  core::ThrowIfDbError(repository_->AppendUsage(tx, record), "append usage");
  return core::ToProto(record);
}

UsageTotals UsageLedger::SumForPeriod(uint64_t user_id, UsageAction action, std::chrono::hours window) {
  auto tx     = repository_->Begin();
  auto totals = SumForPeriod(*tx, user_id, action, window);
  tx->Commit();
  return totals;
}

UsageTotals UsageLedger::SumForPeriod(db::Transaction& tx, uint64_t user_id, UsageAction action, std::chrono::hours window) {
  auto agg = repository_->SumUsage(tx, user_id, std::string(model::ToString(action)), SinceMillis(window));

  UsageTotals totals;
  totals.set_action(action);
  totals.set_count(agg.count);
  totals.set_file_size_mb(agg.file_size_mb);
  totals.set_processing_seconds(agg.processing_time_seconds);
  return totals;
}

UsageSummary UsageLedger::Summary(uint64_t user_id, std::chrono::hours window) {
  const uint64_t since = SinceMillis(window);

  UsageSummary summary;
  summary.set_user_id(user_id);
  summary.set_period_days(static_cast<uint32_t>(window.count() / 24));

  auto tx = repository_->Begin();
  for (auto action : model::kAllUsageActions) {
    auto  agg    = repository_->SumUsage(*tx, user_id, std::string(model::ToString(action)), since);
    auto* totals = summary.add_totals();
    totals->set_action(action);
    totals->set_count(agg.count);
    totals->set_file_size_mb(agg.file_size_mb);
    totals->set_processing_seconds(agg.processing_time_seconds);

    if (action == plancast::v1::USAGE_ACTION_UPLOAD) {
      summary.set_projects_used(agg.count);
      summary.set_upload_mb_used(agg.file_size_mb);
    }
  }
  tx->Commit();
  return summary;
}

std::vector<UsageEntry> UsageLedger::List(uint64_t user_id, std::chrono::hours window) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListUsage(*tx, user_id, SinceMillis(window));
  tx->Commit();

  std::vector<UsageEntry> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(core::ToProto(record));
  }
  return out;
}

} // namespace plancast::usage
