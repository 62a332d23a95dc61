#pragma once

#include <cstdint>
#include <string>

namespace plancast::db::model {

struct UserRecord {
  uint64_t    id = 0;
  std::string email;
  std::string subscription_tier = "free";
  std::string api_key;
  bool        is_active   = true;
  bool        is_verified = false;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace plancast::db::model
