#include "sidecar_geometry_extractor.hpp"

#include <arrow/io/file.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/storage/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace plancast::geometry {

namespace {

bool Finite(const plancast::v1::Point& p) {
  return std::isfinite(p.x()) && std::isfinite(p.y());
}

} // namespace

SidecarGeometryExtractor::SidecarGeometryExtractor(SidecarOptions options) : options_(std::move(options)) {}

std::filesystem::path SidecarGeometryExtractor::SidecarPath(const std::filesystem::path& image_path) const {
  return std::filesystem::path(image_path.string() + options_.suffix);
}

model::RawGeometry SidecarGeometryExtractor::Extract(const std::filesystem::path& image_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(image_path, ec)) {
    throw util::GeometryExtractionError("input image not found: " + image_path.string());
  }

  const auto sidecar = SidecarPath(image_path);
  if (!std::filesystem::is_regular_file(sidecar, ec)) {
    throw util::GeometryExtractionError("no segmentation result for " + image_path.filename().string());
  }

  std::string json;
  try {
    auto file   = storage::Unwrap(arrow::io::ReadableFile::Open(sidecar.string()));
    auto buffer = storage::ReadAll(file);
    json        = buffer->ToString();
  } catch (const std::runtime_error& e) {
    throw util::GeometryExtractionError("read " + sidecar.filename().string() + ": " + e.what());
  }

  plancast::v1::RawGeometry proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::GeometryExtractionError("malformed segmentation result: " + status.ToString());
  }

  for (const auto& room : proto.rooms()) {
    for (const auto& p : room.points()) {
      if (!Finite(p)) throw util::GeometryExtractionError("non-finite coordinate in room '" + room.name() + "'");
    }
  }
  for (const auto& wall : proto.walls()) {
    if (!Finite(wall.start()) || !Finite(wall.end())) throw util::GeometryExtractionError("non-finite wall coordinate");
  }

  if (proto.rooms_size() == 0 && proto.walls_size() == 0) {
    throw util::GeometryExtractionError("segmentation found no rooms or walls");
  }

  return FromProto(proto);
}

} // namespace plancast::geometry
