#pragma once

#include <filesystem>

#include "internal/model/geometry.hpp"

namespace plancast::geometry {

/*
  Floor-plan segmentation capability.

  Implementations report every failure as util::GeometryExtractionError.
*/
class GeometryExtractor {
 public:
  virtual ~GeometryExtractor() = default;

  virtual model::RawGeometry Extract(const std::filesystem::path& image_path) = 0;
};

// Shared by extractor implementations and tests.
model::RawGeometry FromProto(const plancast::v1::RawGeometry& proto);

} // namespace plancast::geometry
