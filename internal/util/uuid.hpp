#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace plancast::util {

/*
  Random RFC4122 v4 identifiers, used for run lease tokens.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateToken() {
  return ToString(GenerateUUID());
}

} // namespace plancast::util
