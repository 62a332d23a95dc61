#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/user_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace plancast::v1;
using plancast::quota::QuotaGate;
using plancast::quota::QuotaPolicy;

struct Fixture {
  std::shared_ptr<plancast::db::memory::MemoryRepository> repository = std::make_shared<plancast::db::memory::MemoryRepository>();
  std::shared_ptr<plancast::usage::UsageLedger>           ledger     = std::make_shared<plancast::usage::UsageLedger>(repository);
  plancast::core::UserRegistry                            users{repository};

  User Register(const std::string& email, SubscriptionTier tier) {
    return users.Register({email, tier});
  }

  void Upload(const User& user, double mb) {
    UsageEntry entry;
    entry.set_user_id(user.id());
    entry.set_action(USAGE_ACTION_UPLOAD);
    entry.set_file_size_mb(mb);
    ledger->Append(entry);
  }
};

QuotaPolicy SmallPolicy() {
  QuotaPolicy policy;
  policy.free       = {2, 10.0, 15.0};
  policy.pro        = {0, 50.0, 0.0};
  policy.enterprise = {0, 0.0, 0.0};
  return policy;
}

void TestProjectCountAtAndUnderLimit() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      user = f.Register("free@example.com", SUBSCRIPTION_TIER_FREE);

  assert(gate.Admit(user, 1.0).allowed);
  f.Upload(user, 1.0);
  // one under the limit
  assert(gate.Admit(user, 1.0).allowed);
  f.Upload(user, 1.0);

  const auto denied = gate.Admit(user, 1.0);
  assert(!denied.allowed);
  assert(denied.reason == DENY_REASON_QUOTA_EXCEEDED);
  assert(denied.message.find("2 projects") != std::string::npos);
}

void TestFileSizeAndUploadVolume() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      user = f.Register("size@example.com", SUBSCRIPTION_TIER_FREE);

  // exactly at the per-file limit is allowed
  assert(gate.Admit(user, 10.0).allowed);
  const auto too_large = gate.Admit(user, 10.01);
  assert(!too_large.allowed && too_large.reason == DENY_REASON_FILE_TOO_LARGE);

  f.Upload(user, 9.0);
  assert(gate.Admit(user, 6.0).allowed);
  const auto volume = gate.Admit(user, 6.5);
  assert(!volume.allowed && volume.reason == DENY_REASON_QUOTA_EXCEEDED);
}

void TestTierLimitsAndUnlimited() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      pro        = f.Register("pro@example.com", SUBSCRIPTION_TIER_PRO);
  auto      enterprise = f.Register("ent@example.com", SUBSCRIPTION_TIER_ENTERPRISE);

  for (int i = 0; i < 5; ++i) f.Upload(pro, 40.0);
  assert(gate.Admit(pro, 50.0).allowed);
  assert(!gate.Admit(pro, 51.0).allowed);

  assert(gate.Admit(enterprise, 5000.0).allowed);
}

void TestInactiveAccountIsDenied() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      user = f.Register("gone@example.com", SUBSCRIPTION_TIER_ENTERPRISE);
  user           = f.users.Update(user.id(), {std::nullopt, false, std::nullopt});

  const auto denied = gate.Admit(user, 1.0);
  assert(!denied.allowed && denied.reason == DENY_REASON_INACTIVE_ACCOUNT);
}

void TestEnforceThrowsWithReason() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      user = f.Register("enforce@example.com", SUBSCRIPTION_TIER_FREE);

  gate.Enforce(user, 1.0);

  bool threw = false;
  try {
    gate.Enforce(user, 11.0);
  } catch (const plancast::util::QuotaExceeded& e) {
    threw = e.reason() == DENY_REASON_FILE_TOO_LARGE;
  }
  assert(threw);
}

void TestSummaryCarriesTierLimits() {
  Fixture   f;
  QuotaGate gate(f.ledger, SmallPolicy());
  auto      user = f.Register("summary@example.com", SUBSCRIPTION_TIER_FREE);
  f.Upload(user, 4.0);

  const auto summary = gate.Summary(user);
  assert(summary.tier() == SUBSCRIPTION_TIER_FREE);
  assert(summary.period_days() == 30);
  assert(summary.projects_used() == 1);
  assert(summary.projects_limit() == 2);
  assert(summary.upload_mb_used() == 4.0);
  assert(summary.upload_mb_limit() == 15.0);
  assert(summary.max_file_size_mb() == 10.0);
}

} // namespace

int main() {
  TestProjectCountAtAndUnderLimit();
  TestFileSizeAndUploadVolume();
  TestTierLimitsAndUnlimited();
  TestInactiveAccountIsDenied();
  TestEnforceThrowsWithReason();
  TestSummaryCarriesTierLimits();

  std::cout << "plancast_unit_quota_gate: pass\n";
  return 0;
}
