#pragma once

#include <string_view>

#include "plancast/v1/types.pb.h"

namespace plancast::model {

using plancast::v1::SubscriptionTier;

constexpr std::string_view ToString(SubscriptionTier tier) {
  switch (tier) {
    case plancast::v1::SUBSCRIPTION_TIER_FREE:
      return "free";
    case plancast::v1::SUBSCRIPTION_TIER_PRO:
      return "pro";
    case plancast::v1::SUBSCRIPTION_TIER_ENTERPRISE:
      return "enterprise";
    default:
      return "unspecified";
  }
}

// Unknown names fall back to free.
constexpr SubscriptionTier ParseSubscriptionTier(std::string_view value) {
  if (value == "pro") return plancast::v1::SUBSCRIPTION_TIER_PRO;
  if (value == "enterprise") return plancast::v1::SUBSCRIPTION_TIER_ENTERPRISE;
  return plancast::v1::SUBSCRIPTION_TIER_FREE;
}

} // namespace plancast::model
