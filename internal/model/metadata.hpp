#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "plancast/v1/types.pb.h"

namespace plancast::model {

/*
  Helpers for building MetadataMap values.

  Keys are free-form; stages own the keys under their own stage name.
*/

inline plancast::v1::MetadataValue Text(std::string_view value) {
  plancast::v1::MetadataValue v;
  v.set_text(std::string(value));
  return v;
}

inline plancast::v1::MetadataValue Number(double value) {
  plancast::v1::MetadataValue v;
  v.set_number(value);
  return v;
}

inline plancast::v1::MetadataValue Path(const std::filesystem::path& value) {
  plancast::v1::MetadataValue v;
  v.set_path(value.string());
  return v;
}

inline plancast::v1::MetadataValue Nested(plancast::v1::MetadataMap map) {
  plancast::v1::MetadataValue v;
  *v.mutable_map() = std::move(map);
  return v;
}

inline void Put(plancast::v1::MetadataMap& map, const std::string& key, plancast::v1::MetadataValue value) {
  (*map.mutable_entries())[key] = std::move(value);
}

} // namespace plancast::model
