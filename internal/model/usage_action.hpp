#pragma once

#include <array>
#include <string_view>

#include "plancast/v1/types.pb.h"

namespace plancast::model {

using plancast::v1::UsageAction;

inline constexpr std::array<UsageAction, 5> kAllUsageActions = {
    plancast::v1::USAGE_ACTION_UPLOAD,   plancast::v1::USAGE_ACTION_PROCESSING, plancast::v1::USAGE_ACTION_DOWNLOAD,
    plancast::v1::USAGE_ACTION_API_CALL, plancast::v1::USAGE_ACTION_EXPORT,
};

constexpr std::string_view ToString(UsageAction action) {
  switch (action) {
    case plancast::v1::USAGE_ACTION_UPLOAD:
      return "upload";
    case plancast::v1::USAGE_ACTION_PROCESSING:
      return "processing";
    case plancast::v1::USAGE_ACTION_DOWNLOAD:
      return "download";
    case plancast::v1::USAGE_ACTION_API_CALL:
      return "api_call";
    case plancast::v1::USAGE_ACTION_EXPORT:
      return "export";
    default:
      return "unspecified";
  }
}

constexpr UsageAction ParseUsageAction(std::string_view value) {
  for (auto action : kAllUsageActions) {
    if (ToString(action) == value) {
      return action;
    }
  }
  return plancast::v1::USAGE_ACTION_UNSPECIFIED;
}

} // namespace plancast::model
