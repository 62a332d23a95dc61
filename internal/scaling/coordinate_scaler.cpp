#include "coordinate_scaler.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace plancast::scaling {

namespace {

using plancast::v1::ScaleReference;

void RequirePositive(double value, const char* what) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw util::ScalingError(fmt::format("{} must be a positive finite number, got {}", what, value));
  }
}

bool IsSet(const std::optional<ScaleReference>& ref) {
  return ref.has_value() && ref->kind_case() != ScaleReference::KIND_NOT_SET;
}

model::Point2 Scaled(const model::Point2& p, double factor) {
  return {p.x * factor, p.y * factor};
}

struct Extent {
  double min_x = std::numeric_limits<double>::infinity();
  double min_y = std::numeric_limits<double>::infinity();
  double max_x = -std::numeric_limits<double>::infinity();
  double max_y = -std::numeric_limits<double>::infinity();

  void Add(const model::Point2& p) {
    min_x = std::min(min_x, p.x);
    min_y = std::min(min_y, p.y);
    max_x = std::max(max_x, p.x);
    max_y = std::max(max_y, p.y);
  }

  bool Empty() const {
    return min_x > max_x;
  }
};

} // namespace

CoordinateScaler::CoordinateScaler(ScalerOptions options) : options_(options) {}

double CoordinateScaler::ResolveFactor(const model::RawGeometry& raw, const ScaleReference& reference) const {
  switch (reference.kind_case()) {
    case ScaleReference::kUnitsPerPixel:
      RequirePositive(reference.units_per_pixel(), "units per pixel");
      return reference.units_per_pixel();

    case ScaleReference::kLength:
      RequirePositive(reference.length().pixel_length(), "reference pixel length");
      RequirePositive(reference.length().real_length(), "reference real length");
      return reference.length().real_length() / reference.length().pixel_length();

    case ScaleReference::kRoom: {
      const auto& room_ref = reference.room();
      RequirePositive(room_ref.real_length(), "reference real length");

      auto it = std::find_if(raw.rooms.begin(), raw.rooms.end(), [&](const auto& room) { return room.name == room_ref.room_name(); });
      if (it == raw.rooms.end()) {
        std::string available;
        for (const auto& room : raw.rooms) {
          if (!available.empty()) available += ", ";
          available += room.name;
        }
        throw util::ScalingError(fmt::format("room '{}' not found; available rooms: {}", room_ref.room_name(), available));
      }

      Extent extent;
      for (const auto& p : it->points) extent.Add(p);
      if (extent.Empty()) throw util::ScalingError("room '" + room_ref.room_name() + "' has no points");

      double pixels = 0.0;
      switch (room_ref.axis()) {
        case plancast::v1::AXIS_WIDTH:
          pixels = extent.max_x - extent.min_x;
          break;
        case plancast::v1::AXIS_LENGTH:
          pixels = extent.max_y - extent.min_y;
          break;
        default:
          throw util::ScalingError("room reference axis must be width or length");
      }
      RequirePositive(pixels, "room pixel extent");
      return room_ref.real_length() / pixels;
    }

    case ScaleReference::KIND_NOT_SET:
    default:
      throw util::ScalingError("missing scale reference");
  }
}

model::ScaledGeometry CoordinateScaler::Scale(const model::RawGeometry& raw, const std::optional<ScaleReference>& reference) const {
  const ScaleReference* chosen = nullptr;
  std::string           source;
  if (IsSet(reference)) {
    chosen = &*reference;
    source = "upload";
  } else if (IsSet(raw.scale_reference)) {
    chosen = &*raw.scale_reference;
    source = "geometry";
  } else {
    throw util::ScalingError("missing scale reference");
  }

  const double factor = ResolveFactor(raw, *chosen);

  model::ScaledGeometry scaled;
  scaled.units_per_pixel  = factor;
  scaled.reference_source = source;

  Extent bounds;
  scaled.rooms.reserve(raw.rooms.size());
  for (const auto& room : raw.rooms) {
    model::RoomOutline out;
    out.name = room.name;
    out.points.reserve(room.points.size());
    for (const auto& p : room.points) {
      out.points.push_back(Scaled(p, factor));
      bounds.Add(out.points.back());
    }
    scaled.rooms.push_back(std::move(out));
  }

  scaled.walls.reserve(raw.walls.size());
  for (const auto& wall : raw.walls) {
    scaled.walls.push_back({Scaled(wall.start, factor), Scaled(wall.end, factor)});
    bounds.Add(scaled.walls.back().start);
    bounds.Add(scaled.walls.back().end);
  }

  if (raw.image_width > 0 && raw.image_height > 0) {
    scaled.building_width  = raw.image_width * factor;
    scaled.building_length = raw.image_height * factor;
  } else if (!bounds.Empty()) {
    scaled.building_width  = bounds.max_x - bounds.min_x;
    scaled.building_length = bounds.max_y - bounds.min_y;
  }
  scaled.building_area = scaled.building_width * scaled.building_length;

  const double pixels_per_unit = 1.0 / factor;
  if (pixels_per_unit < options_.min_pixels_per_unit) {
    scaled.warnings.push_back(
        fmt::format("scale implies {:.3f} pixels per unit, below the expected minimum of {:.3f}", pixels_per_unit, options_.min_pixels_per_unit));
  } else if (pixels_per_unit > options_.max_pixels_per_unit) {
    scaled.warnings.push_back(
        fmt::format("scale implies {:.3f} pixels per unit, above the expected maximum of {:.3f}", pixels_per_unit, options_.max_pixels_per_unit));
  }
  if (raw.walls.empty()) {
    scaled.warnings.push_back("no wall segments detected");
  }
  if (raw.rooms.empty()) {
    scaled.warnings.push_back("no room outlines detected");
  }

  return scaled;
}

} // namespace plancast::scaling
