#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/geometry.hpp"
#include "internal/modeling/mesh_writer.hpp"

namespace plancast::storage {
class ArtifactStore;
}

namespace plancast::modeling {

struct ModelBuilderOptions {
  double wall_height     = 9.0;
  double wall_thickness  = 0.5;
  double min_wall_length = 0.0;
};

struct ExportResult {
  std::map<std::string, std::filesystem::path> files;    // format -> artifact path
  std::map<std::string, std::string>           failures; // format -> ExportError message
};

/*
  Builds a closed 3D model from scaled geometry and exports it.

  Build throws util::ModelBuildError; Export never throws for a single
  format, it records the failure and moves on.
*/
class ModelBuilder {
 public:
  ModelBuilder(ModelBuilderOptions options, std::shared_ptr<storage::ArtifactStore> artifacts,
               std::shared_ptr<const MeshWriterRegistry> writers = MeshWriterRegistry::WithDefaults());

  model::Model3D Build(const model::ScaledGeometry& geometry) const;

  ExportResult Export(uint64_t project_id, const model::Model3D& model, const std::vector<std::string>& formats) const;

  const ModelBuilderOptions& options() const {
    return options_;
  }

 private:
  model::Mesh RoomMesh(const model::RoomOutline& room) const;
  model::Mesh WallMesh(const model::WallSegment& wall, std::size_t index) const;

  ModelBuilderOptions                       options_;
  std::shared_ptr<storage::ArtifactStore>   artifacts_;
  std::shared_ptr<const MeshWriterRegistry> writers_;
};

} // namespace plancast::modeling
