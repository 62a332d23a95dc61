#include "artifact_store.hpp"

#include <arrow/io/file.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/arrow_utils.hpp"
#include "internal/storage/path_utils.hpp"

namespace plancast::storage {

ArtifactStore::ArtifactStore(ArtifactStoreOptions options)
    : options_(std::move(options)), fs_(std::make_shared<arrow::fs::LocalFileSystem>()) {
  options_.root = std::filesystem::absolute(options_.root).lexically_normal();
  Unwrap(fs_->CreateDir((options_.root / "projects").string(), /*recursive=*/true));
}

std::filesystem::path ArtifactStore::ReservePath(uint64_t project_id, const std::string& kind) {
  auto path = ArtifactPath(options_.root, project_id, kind);
  Unwrap(fs_->CreateDir(path.parent_path().string(), /*recursive=*/true));
  return path;
}

bool ArtifactStore::Exists(const std::filesystem::path& path) const {
  auto info = Unwrap(fs_->GetFileInfo(path.string()));
  return info.type() == arrow::fs::FileType::File;
}

/*
  Atomic write:
      write tmp -> flush -> move
*/
void ArtifactStore::Write(const std::filesystem::path& path, std::string_view bytes) {
  CheckUnderRoot(path);

  const auto tmp_path = path.string() + ".tmp";
  try {
    {
      auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
      Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));

      if (options_.fsync) Unwrap(out->Flush());

      Unwrap(out->Close());
    }

    Unwrap(fs_->Move(tmp_path, path.string()));
  } catch (const std::exception&) {
    RemoveTemp(tmp_path);
    throw;
  }
}

void ArtifactStore::RemoveTemp(const std::string& tmp_path) const {
  const auto info = fs_->GetFileInfo(tmp_path);
  if (!info.ok() || info->type() != arrow::fs::FileType::File) return;

  const auto status = fs_->DeleteFile(tmp_path);
  if (!status.ok()) {
    PLANCAST_LOG_WARN("could not remove partial artifact", {observability::StringField("path", tmp_path),
                                                            observability::StringField("error", status.ToString())});
  }
}

std::shared_ptr<arrow::Buffer> ArtifactStore::Read(const std::filesystem::path& path) const {
  CheckUnderRoot(path);
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

void ArtifactStore::CheckUnderRoot(const std::filesystem::path& path) const {
  if (!IsUnder(options_.root, path)) {
    throw std::invalid_argument("artifact path " + path.string() + " is outside " + options_.root.string());
  }
}

} // namespace plancast::storage
