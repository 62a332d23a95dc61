#include "quota_gate.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/model/subscription_tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace plancast::quota {

using plancast::observability::DoubleField;
using plancast::observability::IntField;
using plancast::observability::StringField;

const TierLimits& QuotaPolicy::ForTier(plancast::v1::SubscriptionTier tier) const {
  switch (tier) {
    case plancast::v1::SUBSCRIPTION_TIER_PRO:
      return pro;
    case plancast::v1::SUBSCRIPTION_TIER_ENTERPRISE:
      return enterprise;
    case plancast::v1::SUBSCRIPTION_TIER_FREE:
    default:
      return free;
  }
}

QuotaGate::QuotaGate(std::shared_ptr<usage::UsageLedger> ledger, QuotaPolicy policy) : ledger_(std::move(ledger)), policy_(policy) {}

Admission QuotaGate::Admit(const plancast::v1::User& user, double requested_file_size_mb) {
  return Decide(user, requested_file_size_mb,
                [&] { return ledger_->SumForPeriod(user.id(), plancast::v1::USAGE_ACTION_UPLOAD, policy_.Window()); });
}

Admission QuotaGate::Admit(db::Transaction& tx, const plancast::v1::User& user, double requested_file_size_mb) {
  return Decide(user, requested_file_size_mb,
                [&] { return ledger_->SumForPeriod(tx, user.id(), plancast::v1::USAGE_ACTION_UPLOAD, policy_.Window()); });
}

Admission QuotaGate::Decide(const plancast::v1::User& user, double requested_file_size_mb,
                            const std::function<plancast::v1::UsageTotals()>& sum_uploads) const {
  const auto tier_name = model::ToString(user.tier());

  if (!user.is_active()) {
    return {false, plancast::v1::DENY_REASON_INACTIVE_ACCOUNT, "account is inactive"};
  }

  const auto& limits = policy_.ForTier(user.tier());
  if (limits.max_file_size_mb > 0 && requested_file_size_mb > limits.max_file_size_mb) {
    return {false, plancast::v1::DENY_REASON_FILE_TOO_LARGE,
            fmt::format("file of {:.2f} MB exceeds the {} tier limit of {:.2f} MB", requested_file_size_mb, tier_name, limits.max_file_size_mb)};
  }

  if (limits.max_projects_per_period == 0 && limits.max_upload_mb_per_period <= 0) {
    return {};
  }

  const auto uploads = sum_uploads();

  if (limits.max_projects_per_period > 0 && uploads.count() >= limits.max_projects_per_period) {
    return {false, plancast::v1::DENY_REASON_QUOTA_EXCEEDED,
            fmt::format("{} tier allows {} projects per {} days; {} used", tier_name, limits.max_projects_per_period, policy_.period_days,
                        uploads.count())};
  }

  if (limits.max_upload_mb_per_period > 0 && uploads.file_size_mb() + requested_file_size_mb > limits.max_upload_mb_per_period) {
    return {false, plancast::v1::DENY_REASON_QUOTA_EXCEEDED,
            fmt::format("{} tier allows {:.2f} MB of uploads per {} days; {:.2f} MB used", tier_name, limits.max_upload_mb_per_period,
                        policy_.period_days, uploads.file_size_mb())};
  }

  return {};
}

void QuotaGate::Enforce(const plancast::v1::User& user, double requested_file_size_mb) {
  const auto admission = Admit(user, requested_file_size_mb);
  if (!admission.allowed) Reject(user, requested_file_size_mb, admission);
}

void QuotaGate::Enforce(db::Transaction& tx, const plancast::v1::User& user, double requested_file_size_mb) {
  const auto admission = Admit(tx, user, requested_file_size_mb);
  if (!admission.allowed) Reject(user, requested_file_size_mb, admission);
}

void QuotaGate::Reject(const plancast::v1::User& user, double requested_file_size_mb, const Admission& admission) const {
  const auto reason = plancast::v1::DenyReason_Name(admission.reason);
  PLANCAST_LOG_WARN("project admission denied", {IntField("user_id", static_cast<int64_t>(user.id())), StringField("reason", reason),
                                                 DoubleField("file_size_mb", requested_file_size_mb), StringField("detail", admission.message)});
  observability::Metrics::Instance().RecordQuotaDenial(reason);
  throw util::QuotaExceeded(admission.reason, admission.message);
}

plancast::v1::UsageSummary QuotaGate::Summary(const plancast::v1::User& user) {
  auto        summary = ledger_->Summary(user.id(), policy_.Window());
  const auto& limits  = policy_.ForTier(user.tier());

  summary.set_tier(user.tier());
  summary.set_period_days(policy_.period_days);
  summary.set_projects_limit(limits.max_projects_per_period);
  summary.set_upload_mb_limit(limits.max_upload_mb_per_period);
  summary.set_max_file_size_mb(limits.max_file_size_mb);
  return summary;
}

} // namespace plancast::quota
