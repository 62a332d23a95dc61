#pragma once

#include <string_view>

#include "plancast/v1/types.pb.h"

namespace plancast::model {

using plancast::v1::ProjectStatus;

/*
  Project lifecycle.

    pending -> processing -> completed | failed | cancelled
    pending -> cancelled
    failed  -> pending       (explicit reset only)
*/

constexpr bool IsTerminal(ProjectStatus status) {
  return status == plancast::v1::PROJECT_STATUS_COMPLETED || status == plancast::v1::PROJECT_STATUS_FAILED ||
         status == plancast::v1::PROJECT_STATUS_CANCELLED;
}

constexpr bool CanTransition(ProjectStatus from, ProjectStatus to) {
  using namespace plancast::v1;

  switch (from) {
    case PROJECT_STATUS_PENDING:
      return to == PROJECT_STATUS_PROCESSING || to == PROJECT_STATUS_CANCELLED;
    case PROJECT_STATUS_PROCESSING:
      return to == PROJECT_STATUS_COMPLETED || to == PROJECT_STATUS_FAILED || to == PROJECT_STATUS_CANCELLED;
    case PROJECT_STATUS_FAILED:
      return to == PROJECT_STATUS_PENDING;
    default:
      return false;
  }
}

constexpr std::string_view ToString(ProjectStatus status) {
  switch (status) {
    case plancast::v1::PROJECT_STATUS_PENDING:
      return "pending";
    case plancast::v1::PROJECT_STATUS_PROCESSING:
      return "processing";
    case plancast::v1::PROJECT_STATUS_COMPLETED:
      return "completed";
    case plancast::v1::PROJECT_STATUS_FAILED:
      return "failed";
    case plancast::v1::PROJECT_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

constexpr ProjectStatus ParseProjectStatus(std::string_view value) {
  if (value == "pending") return plancast::v1::PROJECT_STATUS_PENDING;
  if (value == "processing") return plancast::v1::PROJECT_STATUS_PROCESSING;
  if (value == "completed") return plancast::v1::PROJECT_STATUS_COMPLETED;
  if (value == "failed") return plancast::v1::PROJECT_STATUS_FAILED;
  if (value == "cancelled") return plancast::v1::PROJECT_STATUS_CANCELLED;
  return plancast::v1::PROJECT_STATUS_UNSPECIFIED;
}

} // namespace plancast::model
