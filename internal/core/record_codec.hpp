#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "internal/db/model/project_record.hpp"
#include "internal/db/model/usage_record.hpp"
#include "internal/db/model/user_record.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::core {

/*
  Conversion between repository rows and plancast.v1 messages.

  Structured columns (scale reference, metadata maps) hold the proto3 JSON
  form with original field names. Malformed JSON in a row throws
  std::runtime_error.
*/

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

plancast::v1::User      ToProto(const db::model::UserRecord& record);
db::model::UserRecord   ToRecord(const plancast::v1::User& user);

plancast::v1::Project    ToProto(const db::model::ProjectRecord& record);
db::model::ProjectRecord ToRecord(const plancast::v1::Project& project);

plancast::v1::UsageEntry ToProto(const db::model::UsageRecord& record);
db::model::UsageRecord   ToRecord(const plancast::v1::UsageEntry& entry);

// Flattens output_files to format -> path.
plancast::v1::ProjectSnapshot ToSnapshot(const plancast::v1::Project& project);

} // namespace plancast::core
