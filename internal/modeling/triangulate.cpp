#include "triangulate.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace plancast::modeling {

namespace {

constexpr double kEpsilon = 1e-9;

double Cross(const model::Point2& o, const model::Point2& a, const model::Point2& b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

bool SamePoint(const model::Point2& a, const model::Point2& b) {
  return std::abs(a.x - b.x) <= kEpsilon && std::abs(a.y - b.y) <= kEpsilon;
}

// Inclusive of the boundary, so collinear leftovers never form an ear.
bool InTriangle(const model::Point2& p, const model::Point2& a, const model::Point2& b, const model::Point2& c) {
  return Cross(a, b, p) >= -kEpsilon && Cross(b, c, p) >= -kEpsilon && Cross(c, a, p) >= -kEpsilon;
}

std::vector<model::Point2> Clean(const std::vector<model::Point2>& polygon) {
  std::vector<model::Point2> out;
  out.reserve(polygon.size());
  for (const auto& p : polygon) {
    if (out.empty() || !SamePoint(out.back(), p)) out.push_back(p);
  }
  while (out.size() > 1 && SamePoint(out.front(), out.back())) out.pop_back();
  return out;
}

} // namespace

double SignedArea(const std::vector<model::Point2>& points) {
  double twice = 0.0;
  for (std::size_t i = 0, n = points.size(); i < n; ++i) {
    const auto& a = points[i];
    const auto& b = points[(i + 1) % n];
    twice += a.x * b.y - b.x * a.y;
  }
  return twice / 2.0;
}

Triangulation TriangulatePolygon(const std::vector<model::Point2>& polygon) {
  Triangulation result;
  result.points = Clean(polygon);
  if (result.points.size() < 3) {
    throw util::ModelBuildError("polygon needs at least 3 distinct points");
  }

  double area = SignedArea(result.points);
  if (std::abs(area) <= kEpsilon) {
    throw util::ModelBuildError("polygon has zero area");
  }
  if (area < 0) {
    std::reverse(result.points.begin(), result.points.end());
    area = -area;
  }
  result.area = area;

  const auto&                pts = result.points;
  std::vector<std::uint32_t> remaining(pts.size());
  for (std::uint32_t i = 0; i < remaining.size(); ++i) remaining[i] = i;

  while (remaining.size() > 3) {
    const std::size_t n       = remaining.size();
    bool              clipped = false;

    for (std::size_t i = 0; i < n; ++i) {
      const auto prev = remaining[(i + n - 1) % n];
      const auto cur  = remaining[i];
      const auto next = remaining[(i + 1) % n];

      const double turn = Cross(pts[prev], pts[cur], pts[next]);
      if (turn <= kEpsilon) {
        // Drop collinear vertices outright; reflex ones are not ears.
        if (std::abs(turn) <= kEpsilon) {
          remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
          clipped = true;
          break;
        }
        continue;
      }

      bool contains_other = false;
      for (auto other : remaining) {
        if (other == prev || other == cur || other == next) continue;
        if (InTriangle(pts[other], pts[prev], pts[cur], pts[next])) {
          contains_other = true;
          break;
        }
      }
      if (contains_other) continue;

      result.triangles.push_back({prev, cur, next});
      remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
      clipped = true;
      break;
    }

    if (!clipped) {
      throw util::ModelBuildError("polygon is self-intersecting");
    }
  }

  if (Cross(pts[remaining[0]], pts[remaining[1]], pts[remaining[2]]) > kEpsilon) {
    result.triangles.push_back({remaining[0], remaining[1], remaining[2]});
  }
  if (result.triangles.empty()) {
    throw util::ModelBuildError("polygon has zero area");
  }
  return result;
}

} // namespace plancast::modeling
