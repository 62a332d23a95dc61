#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace plancast::core {

// Converts a failed repository Result into the matching exception.
inline void ThrowIfDbError(const plancast::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string message = context + ": " + (result.message.empty() ? std::string(plancast::db::ToString(result.code)) : result.message);
  switch (result.code) {
    case plancast::db::ErrorCode::NotFound:
      throw plancast::util::NotFound(message);
    case plancast::db::ErrorCode::AlreadyExists:
      throw plancast::util::AlreadyExists(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace plancast::core
