#pragma once

#include <string>

#include "internal/geometry/geometry_extractor.hpp"

namespace plancast::geometry {

struct SidecarOptions {
  std::string suffix = ".geometry.json";
};

/*
  Reads the segmentation service's result stored next to the image
  (<image><suffix>) as the JSON mapping of plancast.v1.RawGeometry.
*/
class SidecarGeometryExtractor final : public GeometryExtractor {
 public:
  explicit SidecarGeometryExtractor(SidecarOptions options = {});

  model::RawGeometry Extract(const std::filesystem::path& image_path) override;

  std::filesystem::path SidecarPath(const std::filesystem::path& image_path) const;

 private:
  SidecarOptions options_;
};

} // namespace plancast::geometry
