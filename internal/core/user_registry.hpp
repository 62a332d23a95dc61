#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::core {

struct NewUser {
  std::string                    email;
  plancast::v1::SubscriptionTier tier = plancast::v1::SUBSCRIPTION_TIER_FREE;
  std::string                    api_key;
  bool                           is_verified = false;
};

struct UserUpdate {
  std::optional<plancast::v1::SubscriptionTier> tier;
  std::optional<bool>                           is_active;
  std::optional<bool>                           is_verified;
};

/*
  Accounts. Only tier, flags and updated_at change after registration.
*/
class UserRegistry {
 public:
  explicit UserRegistry(std::shared_ptr<db::Repository> repository);

  // Throws util::InvalidInput for a malformed email, util::AlreadyExists on a
  // duplicate email or api key.
  plancast::v1::User Register(const NewUser& user);

  // Throws util::NotFound.
  plancast::v1::User Get(uint64_t user_id);

  plancast::v1::User Update(uint64_t user_id, const UserUpdate& update);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace plancast::core
