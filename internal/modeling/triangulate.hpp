#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "internal/model/geometry.hpp"

namespace plancast::modeling {

struct Triangulation {
  std::vector<model::Point2>                points;     // cleaned, counter-clockwise
  std::vector<std::array<std::uint32_t, 3>> triangles;  // indices into points, counter-clockwise
  double                                    area = 0.0;
};

double SignedArea(const std::vector<model::Point2>& points);

/*
  Ear-clipping triangulation of a simple polygon.

  Repeated consecutive points and a closing duplicate are dropped, and the
  winding is normalized to counter-clockwise. Throws util::ModelBuildError
  for fewer than three distinct points, zero area, or a polygon with no ear
  (self-intersecting input).
*/
Triangulation TriangulatePolygon(const std::vector<model::Point2>& polygon);

} // namespace plancast::modeling
