#include "model_builder.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/modeling/triangulate.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace plancast::modeling {

namespace {

using plancast::observability::IntField;
using plancast::observability::StringField;

/*
  Extrudes a counter-clockwise footprint from z = 0 to z = height.
  Vertices [0, n) are the floor ring, [n, 2n) the ceiling ring.
*/
model::Mesh Extrude(std::string name, const Triangulation& footprint, double height) {
  const auto& pts = footprint.points;
  const auto  n   = static_cast<std::uint32_t>(pts.size());

  model::Mesh mesh;
  mesh.name = std::move(name);
  mesh.vertices.reserve(2 * n);
  for (const auto& p : pts) mesh.vertices.push_back({p.x, p.y, 0.0});
  for (const auto& p : pts) mesh.vertices.push_back({p.x, p.y, height});

  mesh.triangles.reserve(2 * footprint.triangles.size() + 2 * n);
  for (const auto& t : footprint.triangles) {
    mesh.triangles.push_back({t[0], t[2], t[1]});             // floor faces down
    mesh.triangles.push_back({t[0] + n, t[1] + n, t[2] + n}); // ceiling faces up
  }
  for (std::uint32_t i = 0; i < n; ++i) {
    const std::uint32_t j = (i + 1) % n;
    mesh.triangles.push_back({i, j, j + n});
    mesh.triangles.push_back({i, j + n, i + n});
  }
  return mesh;
}

void Extend(model::Bounds3& bounds, const model::Vertex3& v) {
  bounds.min = {std::min(bounds.min.x, v.x), std::min(bounds.min.y, v.y), std::min(bounds.min.z, v.z)};
  bounds.max = {std::max(bounds.max.x, v.x), std::max(bounds.max.y, v.y), std::max(bounds.max.z, v.z)};
}

} // namespace

ModelBuilder::ModelBuilder(ModelBuilderOptions options, std::shared_ptr<storage::ArtifactStore> artifacts,
                           std::shared_ptr<const MeshWriterRegistry> writers)
    : options_(options), artifacts_(std::move(artifacts)), writers_(std::move(writers)) {
  if (!(options_.wall_height > 0.0) || !std::isfinite(options_.wall_height)) {
    throw std::invalid_argument("wall height must be positive");
  }
  if (!(options_.wall_thickness > 0.0) || !std::isfinite(options_.wall_thickness)) {
    throw std::invalid_argument("wall thickness must be positive");
  }
}

model::Mesh ModelBuilder::RoomMesh(const model::RoomOutline& room) const {
  try {
    return Extrude("room:" + room.name, TriangulatePolygon(room.points), options_.wall_height);
  } catch (const util::ModelBuildError& e) {
    throw util::ModelBuildError("room '" + room.name + "': " + e.what());
  }
}

model::Mesh ModelBuilder::WallMesh(const model::WallSegment& wall, std::size_t index) const {
  const double dx     = wall.end.x - wall.start.x;
  const double dy     = wall.end.y - wall.start.y;
  const double length = std::hypot(dx, dy);

  if (!(length > 1e-9) || length < options_.min_wall_length) {
    throw util::ModelBuildError(fmt::format("wall {} is {:.4f} long, shorter than the minimum {:.4f}", index, length, options_.min_wall_length));
  }

  // left-hand normal scaled to half the thickness
  const double nx = -dy / length * options_.wall_thickness / 2.0;
  const double ny = dx / length * options_.wall_thickness / 2.0;

  Triangulation box;
  box.points = {
      {wall.start.x - nx, wall.start.y - ny},
      {wall.end.x - nx, wall.end.y - ny},
      {wall.end.x + nx, wall.end.y + ny},
      {wall.start.x + nx, wall.start.y + ny},
  };
  box.triangles = {{0, 1, 2}, {0, 2, 3}};
  box.area      = length * options_.wall_thickness;

  return Extrude(fmt::format("wall:{}", index), box, options_.wall_height);
}

model::Model3D ModelBuilder::Build(const model::ScaledGeometry& geometry) const {
  if (geometry.rooms.empty() && geometry.walls.empty()) {
    throw util::ModelBuildError("no rooms or walls to build");
  }

  model::Model3D model;
  model.meshes.reserve(geometry.rooms.size() + geometry.walls.size());
  for (const auto& room : geometry.rooms) {
    model.meshes.push_back(RoomMesh(room));
  }
  for (std::size_t i = 0; i < geometry.walls.size(); ++i) {
    model.meshes.push_back(WallMesh(geometry.walls[i], i));
  }

  constexpr double inf = std::numeric_limits<double>::infinity();
  model.bounds         = {{inf, inf, inf}, {-inf, -inf, -inf}};
  for (const auto& mesh : model.meshes) {
    for (const auto& v : mesh.vertices) Extend(model.bounds, v);
  }
  return model;
}

ExportResult ModelBuilder::Export(uint64_t project_id, const model::Model3D& model, const std::vector<std::string>& formats) const {
  ExportResult result;

  for (const auto& requested : formats) {
    const auto format = NormalizeFormat(requested);
    if (result.files.contains(format) || result.failures.contains(format)) continue;

    try {
      const auto* writer = writers_->Find(format);
      if (writer == nullptr) {
        throw util::ExportError(format, "unsupported export format");
      }

      std::string bytes;
      try {
        bytes = writer->Encode(model);
      } catch (const util::ExportError&) {
        throw;
      } catch (const std::exception& e) {
        throw util::ExportError(format, std::string("encode failed: ") + e.what());
      }

      std::filesystem::path path;
      try {
        path = artifacts_->ReservePath(project_id, "model." + format);
        artifacts_->Write(path, bytes);
      } catch (const std::exception& e) {
        throw util::ExportError(format, std::string("write failed: ") + e.what());
      }

      result.files.emplace(format, std::move(path));
    } catch (const util::ExportError& e) {
      PLANCAST_LOG_WARN("model export failed", {IntField("project_id", static_cast<int64_t>(project_id)), StringField("format", e.format()),
                                                StringField("error", e.what())});
      result.failures.emplace(format, e.what());
    }
  }

  return result;
}

} // namespace plancast::modeling
