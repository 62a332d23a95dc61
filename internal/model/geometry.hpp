#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "plancast/v1/types.pb.h"

namespace plancast::model {

struct Point2 {
  double x = 0.0;
  double y = 0.0;
};

struct RoomOutline {
  std::string         name;
  std::vector<Point2> points;
};

struct WallSegment {
  Point2 start;
  Point2 end;
};

/*
  Output of the geometry capability, in image pixels.
*/
struct RawGeometry {
  std::vector<RoomOutline>                    rooms;
  std::vector<WallSegment>                    walls;
  std::optional<plancast::v1::ScaleReference> scale_reference;
  std::uint32_t                               image_width  = 0;
  std::uint32_t                               image_height = 0;
};

/*
  Geometry in real-world units.
*/
struct ScaledGeometry {
  std::vector<RoomOutline> rooms;
  std::vector<WallSegment> walls;

  double      units_per_pixel = 0.0;
  std::string reference_source;

  double building_width  = 0.0;
  double building_length = 0.0;
  double building_area   = 0.0;

  std::vector<std::string> warnings;
};

struct Vertex3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

struct Triangle {
  std::uint32_t a = 0;
  std::uint32_t b = 0;
  std::uint32_t c = 0;
};

struct Mesh {
  std::string           name;
  std::vector<Vertex3>  vertices;
  std::vector<Triangle> triangles;
};

struct Bounds3 {
  Vertex3 min;
  Vertex3 max;
};

struct Model3D {
  std::vector<Mesh> meshes;
  Bounds3           bounds;

  std::size_t VertexCount() const {
    std::size_t total = 0;
    for (const auto& mesh : meshes) total += mesh.vertices.size();
    return total;
  }

  std::size_t TriangleCount() const {
    std::size_t total = 0;
    for (const auto& mesh : meshes) total += mesh.triangles.size();
    return total;
  }
};

} // namespace plancast::model
