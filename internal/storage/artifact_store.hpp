#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace plancast::storage {

struct ArtifactStoreOptions {
  std::filesystem::path root  = "./artifacts";
  bool                  fsync = false;
};

/*
  Output file locations for projects, written through Arrow IO.

  Layout: <root>/projects/<project_id>/<kind>. Contents are opaque bytes.
  Writes go to <path>.tmp and are moved into place, so a reader never
  sees a partial artifact.
*/
class ArtifactStore {
 public:
  explicit ArtifactStore(ArtifactStoreOptions options);

  // Creates the project directory. Throws std::invalid_argument for a bad kind.
  std::filesystem::path ReservePath(uint64_t project_id, const std::string& kind);

  bool Exists(const std::filesystem::path& path) const;

  // path must lie under the store root. On failure no <path>.tmp is left.
  void Write(const std::filesystem::path& path, std::string_view bytes);

  std::shared_ptr<arrow::Buffer> Read(const std::filesystem::path& path) const;

  const std::filesystem::path& root() const {
    return options_.root;
  }

 private:
  void CheckUnderRoot(const std::filesystem::path& path) const;

  // Deletes a leftover <path>.tmp after a failed write.
  void RemoveTemp(const std::string& tmp_path) const;

  ArtifactStoreOptions                        options_;
  std::shared_ptr<arrow::fs::LocalFileSystem> fs_;
};

} // namespace plancast::storage
