#pragma once

#include <optional>

#include "internal/model/geometry.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::scaling {

// Sanity band for the implied image resolution (pixels per real unit).
struct ScalerOptions {
  double min_pixels_per_unit = 1.0;
  double max_pixels_per_unit = 50.0;
};

/*
  Converts pixel-space geometry to real-world units.

  The upload's reference wins over one embedded in the geometry. All
  failures throw util::ScalingError. Pure: same input, same output.
*/
class CoordinateScaler {
 public:
  explicit CoordinateScaler(ScalerOptions options = {});

  model::ScaledGeometry Scale(const model::RawGeometry& raw, const std::optional<plancast::v1::ScaleReference>& reference) const;

  // Real units per pixel for a reference against raw.
  double ResolveFactor(const model::RawGeometry& raw, const plancast::v1::ScaleReference& reference) const;

 private:
  ScalerOptions options_;
};

} // namespace plancast::scaling
