#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace plancast::storage {

// An artifact kind is one file name: no separators, no dot components.
inline void ValidateArtifactKind(const std::string& kind) {
  if (kind.empty()) {
    throw std::invalid_argument("artifact kind must not be empty");
  }
  for (char c : kind) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("artifact kind contains invalid character");
    }
  }
  if (kind == "." || kind == "..") {
    throw std::invalid_argument("artifact kind must not be a relative path component");
  }
}

inline std::filesystem::path ProjectDir(const std::filesystem::path& root, uint64_t project_id) {
  return root / "projects" / std::to_string(project_id);
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, uint64_t project_id, const std::string& kind) {
  ValidateArtifactKind(kind);
  return ProjectDir(root, project_id) / kind;
}

// True if path is root itself or lexically inside it.
inline bool IsUnder(const std::filesystem::path& root, const std::filesystem::path& path) {
  auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

} // namespace plancast::storage
