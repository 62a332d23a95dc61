#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/usage/usage_ledger.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::quota {

// Zero means unlimited for every field.
struct TierLimits {
  uint32_t max_projects_per_period  = 0;
  double   max_file_size_mb         = 0.0;
  double   max_upload_mb_per_period = 0.0;
};

struct QuotaPolicy {
  uint32_t   period_days = 30;
  TierLimits free{5, 16.0, 0.0};
  TierLimits pro{100, 50.0, 0.0};
  TierLimits enterprise{0, 100.0, 0.0};

  const TierLimits& ForTier(plancast::v1::SubscriptionTier tier) const;

  std::chrono::hours Window() const {
    return std::chrono::hours(24 * static_cast<int64_t>(period_days));
  }
};

struct Admission {
  bool                     allowed = true;
  plancast::v1::DenyReason reason  = plancast::v1::DENY_REASON_UNSPECIFIED;
  std::string              message;
};

/*
  Admission check for new projects. Reads the usage ledger, never writes.
*/
class QuotaGate {
 public:
  QuotaGate(std::shared_ptr<usage::UsageLedger> ledger, QuotaPolicy policy);

  Admission Admit(const plancast::v1::User& user, double requested_file_size_mb);

  // Reads the ledger inside the caller's transaction, so a check and the
  // upload entry it guards commit together.
  Admission Admit(db::Transaction& tx, const plancast::v1::User& user, double requested_file_size_mb);

  // Throws util::QuotaExceeded with the deny reason.
  void Enforce(const plancast::v1::User& user, double requested_file_size_mb);
  void Enforce(db::Transaction& tx, const plancast::v1::User& user, double requested_file_size_mb);

  // Ledger totals plus the user's tier limits.
  plancast::v1::UsageSummary Summary(const plancast::v1::User& user);

  const QuotaPolicy& policy() const {
    return policy_;
  }

 private:
  Admission Decide(const plancast::v1::User& user, double requested_file_size_mb,
                   const std::function<plancast::v1::UsageTotals()>& uploads) const;
  void      Reject(const plancast::v1::User& user, double requested_file_size_mb, const Admission& admission) const;

  std::shared_ptr<usage::UsageLedger> ledger_;
  QuotaPolicy                         policy_;
};

} // namespace plancast::quota
