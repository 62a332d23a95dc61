#include "user_registry.hpp"

#include "internal/core/db_error.hpp"
#include "internal/core/record_codec.hpp"
#include "internal/model/subscription_tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace plancast::core {

using plancast::observability::IntField;
using plancast::observability::StringField;

UserRegistry::UserRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {}

plancast::v1::User UserRegistry::Register(const NewUser& user) {
  const auto at = user.email.find('@');
  if (user.email.empty() || at == std::string::npos || at == 0 || at + 1 == user.email.size()) {
    throw util::InvalidInput("register user: email '" + user.email + "' is not a valid address");
  }

  db::model::UserRecord record;
  record.email             = user.email;
  record.subscription_tier = std::string(model::ToString(user.tier == plancast::v1::SUBSCRIPTION_TIER_UNSPECIFIED ? plancast::v1::SUBSCRIPTION_TIER_FREE : user.tier));
  record.api_key           = user.api_key;
  record.is_active         = true;
  record.is_verified       = user.is_verified;
  record.created_at_ms     = util::ToUnixMillis(util::Now());
  record.updated_at_ms     = record.created_at_ms;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertUser(*tx, record), "register user");
  tx->Commit();

  PLANCAST_LOG_INFO("user registered", {IntField("user_id", static_cast<int64_t>(record.id)), StringField("tier", record.subscription_tier)});
  return ToProto(record);
}

plancast::v1::User UserRegistry::Get(uint64_t user_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetUser(*tx, user_id);
  tx->Commit();

  if (!record) throw util::NotFound("user " + std::to_string(user_id) + " not found");
  return ToProto(*record);
}

plancast::v1::User UserRegistry::Update(uint64_t user_id, const UserUpdate& update) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetUser(*tx, user_id);
  if (!record) throw util::NotFound("user " + std::to_string(user_id) + " not found");

  if (update.tier && *update.tier != plancast::v1::SUBSCRIPTION_TIER_UNSPECIFIED) {
    record->subscription_tier = std::string(model::ToString(*update.tier));
  }
  if (update.is_active) record->is_active = *update.is_active;
  if (update.is_verified) record->is_verified = *update.is_verified;
  record->updated_at_ms = util::ToUnixMillis(util::Now());

  ThrowIfDbError(repository_->UpdateUser(*tx, *record), "update user");
  tx->Commit();
  return ToProto(*record);
}

} // namespace plancast::core
