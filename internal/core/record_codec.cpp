#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/model/subscription_tier.hpp"
#include "internal/model/usage_action.hpp"
#include "internal/util/time.hpp"

namespace plancast::core {

namespace {

uint64_t MillisOrZero(bool has, const google::protobuf::Timestamp& ts) {
  return has ? util::ToUnixMillis(util::FromProto(ts)) : 0;
}

} // namespace

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("encode " + message.GetTypeName() + ": " + status.ToString());
  }
  return out;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  message->Clear();
  if (json.empty()) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("decode " + message->GetTypeName() + ": " + status.ToString());
  }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

plancast::v1::User ToProto(const db::model::UserRecord& record) {
  plancast::v1::User user;
  user.set_id(record.id);
  user.set_email(record.email);
  user.set_tier(model::ParseSubscriptionTier(record.subscription_tier));
  user.set_api_key(record.api_key);
  user.set_is_active(record.is_active);
  user.set_is_verified(record.is_verified);
  util::SetFromUnixMillis(record.created_at_ms, user.mutable_created_at());
  util::SetFromUnixMillis(record.updated_at_ms, user.mutable_updated_at());
  return user;
}

db::model::UserRecord ToRecord(const plancast::v1::User& user) {
  db::model::UserRecord record;
  record.id                = user.id();
  record.email             = user.email();
  record.subscription_tier = std::string(model::ToString(user.tier()));
  record.api_key           = user.api_key();
  record.is_active         = user.is_active();
  record.is_verified       = user.is_verified();
  record.created_at_ms     = MillisOrZero(user.has_created_at(), user.created_at());
  record.updated_at_ms     = MillisOrZero(user.has_updated_at(), user.updated_at());
  return record;
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

plancast::v1::Project ToProto(const db::model::ProjectRecord& record) {
  plancast::v1::Project project;
  project.set_id(record.id);
  project.set_user_id(record.user_id);

  auto* input = project.mutable_input();
  input->set_filename(record.filename);
  input->set_original_filename(record.original_filename);
  input->set_input_path(record.input_file_path);
  input->set_file_size_mb(record.file_size_mb);
  input->set_file_format(record.file_format);

  if (!record.scale_reference_json.empty()) {
    FromJson(record.scale_reference_json, project.mutable_scale_reference());
  }

  project.set_status(model::ParseProjectStatus(record.status));
  project.set_current_step(record.current_step);
  project.set_progress_percent(record.progress_percent);
  FromJson(record.output_files_json, project.mutable_output_files());
  FromJson(record.processing_metadata_json, project.mutable_processing_metadata());
  project.set_error_message(record.error_message);

  util::SetFromUnixMillis(record.created_at_ms, project.mutable_created_at());
  util::SetFromUnixMillis(record.updated_at_ms, project.mutable_updated_at());
  if (record.started_at_ms != 0) util::SetFromUnixMillis(record.started_at_ms, project.mutable_started_at());
  if (record.completed_at_ms != 0) util::SetFromUnixMillis(record.completed_at_ms, project.mutable_completed_at());
  return project;
}

db::model::ProjectRecord ToRecord(const plancast::v1::Project& project) {
  db::model::ProjectRecord record;
  record.id                = project.id();
  record.user_id           = project.user_id();
  record.filename          = project.input().filename();
  record.original_filename = project.input().original_filename();
  record.input_file_path   = project.input().input_path();
  record.file_size_mb      = project.input().file_size_mb();
  record.file_format       = project.input().file_format();
  if (project.has_scale_reference()) {
    record.scale_reference_json = ToJson(project.scale_reference());
  }

  record.status                   = std::string(model::ToString(project.status()));
  record.current_step             = project.current_step();
  record.progress_percent         = project.progress_percent();
  record.output_files_json        = ToJson(project.output_files());
  record.processing_metadata_json = ToJson(project.processing_metadata());
  record.error_message            = project.error_message();

  record.created_at_ms   = MillisOrZero(project.has_created_at(), project.created_at());
  record.updated_at_ms   = MillisOrZero(project.has_updated_at(), project.updated_at());
  record.started_at_ms   = MillisOrZero(project.has_started_at(), project.started_at());
  record.completed_at_ms = MillisOrZero(project.has_completed_at(), project.completed_at());
  return record;
}

plancast::v1::ProjectSnapshot ToSnapshot(const plancast::v1::Project& project) {
  plancast::v1::ProjectSnapshot snapshot;
  snapshot.set_project_id(project.id());
  snapshot.set_status(project.status());
  snapshot.set_current_step(project.current_step());
  snapshot.set_progress_percent(project.progress_percent());
  snapshot.set_error_message(project.error_message());

  for (const auto& [format, value] : project.output_files().entries()) {
    if (value.has_path()) {
      (*snapshot.mutable_output_files())[format] = value.path();
    } else if (value.has_text()) {
      (*snapshot.mutable_output_files())[format] = value.text();
    }
  }

  if (project.has_created_at()) *snapshot.mutable_created_at() = project.created_at();
  if (project.has_updated_at()) *snapshot.mutable_updated_at() = project.updated_at();
  if (project.has_started_at()) *snapshot.mutable_started_at() = project.started_at();
  if (project.has_completed_at()) *snapshot.mutable_completed_at() = project.completed_at();
  return snapshot;
}

// ------------------------------------------------------------------
// Usage
// ------------------------------------------------------------------

plancast::v1::UsageEntry ToProto(const db::model::UsageRecord& record) {
  plancast::v1::UsageEntry entry;
  entry.set_id(record.id);
  entry.set_user_id(record.user_id);
  if (record.project_id) entry.set_project_id(*record.project_id);
  entry.set_action(model::ParseUsageAction(record.action_type));
  entry.set_endpoint(record.api_endpoint);
  entry.set_file_size_mb(record.file_size_mb);
  entry.set_processing_seconds(record.processing_time_seconds);
  FromJson(record.request_metadata_json, entry.mutable_request_metadata());
  util::SetFromUnixMillis(record.created_at_ms, entry.mutable_created_at());
  return entry;
}

db::model::UsageRecord ToRecord(const plancast::v1::UsageEntry& entry) {
  db::model::UsageRecord record;
  record.id      = entry.id();
  record.user_id = entry.user_id();
  if (entry.has_project_id()) record.project_id = entry.project_id();
  record.action_type             = std::string(model::ToString(entry.action()));
  record.api_endpoint            = entry.endpoint();
  record.file_size_mb            = entry.file_size_mb();
  record.processing_time_seconds = entry.processing_seconds();
  record.request_metadata_json   = ToJson(entry.request_metadata());
  record.created_at_ms           = MillisOrZero(entry.has_created_at(), entry.created_at());
  return record;
}

} // namespace plancast::core
