#include "geometry_extractor.hpp"

namespace plancast::geometry {

model::RawGeometry FromProto(const plancast::v1::RawGeometry& proto) {
  model::RawGeometry raw;
  raw.image_width  = proto.image_width();
  raw.image_height = proto.image_height();

  raw.rooms.reserve(static_cast<size_t>(proto.rooms_size()));
  for (const auto& room : proto.rooms()) {
    model::RoomOutline outline;
    outline.name = room.name();
    for (const auto& p : room.points()) {
      outline.points.push_back({p.x(), p.y()});
    }
    raw.rooms.push_back(std::move(outline));
  }

  raw.walls.reserve(static_cast<size_t>(proto.walls_size()));
  for (const auto& wall : proto.walls()) {
    raw.walls.push_back({{wall.start().x(), wall.start().y()}, {wall.end().x(), wall.end().y()}});
  }

  if (proto.has_scale_reference() && proto.scale_reference().kind_case() != plancast::v1::ScaleReference::KIND_NOT_SET) {
    raw.scale_reference = proto.scale_reference();
  }
  return raw;
}

} // namespace plancast::geometry
