#pragma once

#include <cstdint>
#include <string>

namespace plancast::db::model {

/*
  One row of the projects table.

  *_json columns hold the proto3 JSON form of plancast.v1 messages
  (ScaleReference, MetadataMap). Timestamps of 0 are unset.
*/
struct ProjectRecord {
  uint64_t id      = 0;
  uint64_t user_id = 0;

  std::string filename;
  std::string original_filename;
  std::string input_file_path;
  double      file_size_mb = 0.0;
  std::string file_format;
  std::string scale_reference_json;

  std::string status = "pending";
  std::string current_step;
  uint32_t    progress_percent = 0;
  std::string output_files_json        = "{}";
  std::string processing_metadata_json = "{}";
  std::string error_message;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
};

} // namespace plancast::db::model
