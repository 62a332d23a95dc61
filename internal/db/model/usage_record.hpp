#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace plancast::db::model {

// Append-only; never updated or deleted by the core.
struct UsageRecord {
  uint64_t                id      = 0;
  uint64_t                user_id = 0;
  std::optional<uint64_t> project_id;
  std::string             action_type;
  std::string             api_endpoint;
  double                  file_size_mb            = 0.0;
  double                  processing_time_seconds = 0.0;
  std::string             request_metadata_json   = "{}";
  uint64_t                created_at_ms           = 0;
};

struct UsageAggregate {
  uint64_t count                   = 0;
  double   file_size_mb            = 0.0;
  double   processing_time_seconds = 0.0;
};

} // namespace plancast::db::model
