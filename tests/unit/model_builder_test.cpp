#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/modeling/mesh_writer.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/modeling/triangulate.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using plancast::model::ScaledGeometry;
using plancast::modeling::ModelBuilder;
using plancast::modeling::ModelBuilderOptions;

std::shared_ptr<plancast::storage::ArtifactStore> TempStore(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "plancast_model_builder_tests" / name;
  std::filesystem::remove_all(root);
  return std::make_shared<plancast::storage::ArtifactStore>(plancast::storage::ArtifactStoreOptions{root, false});
}

ScaledGeometry RoomAndWall() {
  ScaledGeometry geometry;
  geometry.rooms.push_back({"kitchen", {{0, 0}, {10, 0}, {10, 8}, {0, 8}}});
  geometry.walls.push_back({{0, 0}, {10, 0}});
  return geometry;
}

std::uint32_t ReadU32(const std::string& bytes, std::size_t offset) {
  std::uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(bytes[offset + i]);
  return v;
}

class BrokenWriter final : public plancast::modeling::MeshWriter {
 public:
  std::string Format() const override {
    return "obj";
  }
  std::string Encode(const plancast::model::Model3D&) const override {
    throw std::runtime_error("writer exploded");
  }
};

void TestTriangulateConcavePolygon() {
  // L shape, clockwise input
  const auto tri = plancast::modeling::TriangulatePolygon({{0, 0}, {0, 4}, {2, 4}, {2, 2}, {4, 2}, {4, 0}});
  assert(tri.triangles.size() == 4);
  assert(std::fabs(tri.area - 12.0) < 1e-9);
  assert(plancast::modeling::SignedArea(tri.points) > 0.0);

  bool threw = false;
  try {
    (void)plancast::modeling::TriangulatePolygon({{0, 0}, {1, 1}, {2, 2}});
  } catch (const plancast::util::ModelBuildError&) {
    threw = true;
  }
  assert(threw && "collinear outline has no area");
}

void TestBuildExtrudesRoomsAndWalls() {
  ModelBuilder builder(ModelBuilderOptions{9.0, 0.5, 0.0}, TempStore("build"));
  const auto   model = builder.Build(RoomAndWall());

  assert(model.meshes.size() == 2);
  assert(model.meshes[0].name == "room:kitchen");
  assert(model.meshes[1].name == "wall:0");
  assert(model.meshes[0].vertices.size() == 8);
  assert(model.meshes[0].triangles.size() == 12);
  assert(model.meshes[1].vertices.size() == 8);
  assert(model.meshes[1].triangles.size() == 12);

  assert(std::fabs(model.bounds.min.y + 0.25) < 1e-9);
  assert(std::fabs(model.bounds.max.x - 10.0) < 1e-9);
  assert(std::fabs(model.bounds.max.y - 8.0) < 1e-9);
  assert(std::fabs(model.bounds.max.z - 9.0) < 1e-9);
  assert(model.bounds.min.z == 0.0);
}

void TestBuildRejectsEmptyAndShortWalls() {
  ModelBuilder builder(ModelBuilderOptions{9.0, 0.5, 1.0}, TempStore("reject"));

  bool threw = false;
  try {
    (void)builder.Build(ScaledGeometry{});
  } catch (const plancast::util::ModelBuildError&) {
    threw = true;
  }
  assert(threw);

  ScaledGeometry short_wall;
  short_wall.walls.push_back({{0, 0}, {0.5, 0}});
  threw = false;
  try {
    (void)builder.Build(short_wall);
  } catch (const plancast::util::ModelBuildError& e) {
    threw = std::string(e.what()).find("wall 0") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    ModelBuilder invalid(ModelBuilderOptions{0.0, 0.5, 0.0}, TempStore("invalid"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestWritersProduceWellFormedFiles() {
  ModelBuilder builder(ModelBuilderOptions{}, TempStore("writers"));
  const auto   model = builder.Build(RoomAndWall());

  const auto obj = plancast::modeling::ObjWriter{}.Encode(model);
  assert(obj.find("o room:kitchen\n") != std::string::npos);
  assert(obj.find("o wall:0\n") != std::string::npos);
  std::istringstream lines(obj);
  std::string        line;
  int                vertices = 0, faces = 0;
  while (std::getline(lines, line)) {
    if (line.rfind("v ", 0) == 0) ++vertices;
    if (line.rfind("f ", 0) == 0) ++faces;
  }
  assert(vertices == 16);
  assert(faces == 24);
  // second mesh indices start after the first mesh's vertices
  assert(obj.find("f 9 ") != std::string::npos);

  const auto stl = plancast::modeling::StlWriter{}.Encode(model);
  assert(stl.size() == 84 + 24 * 50);
  assert(stl.compare(0, 19, "plancast binary stl") == 0);
  assert(ReadU32(stl, 80) == 24);

  const auto glb = plancast::modeling::GlbWriter{}.Encode(model);
  assert(glb.compare(0, 4, "glTF") == 0);
  assert(ReadU32(glb, 4) == 2);
  assert(ReadU32(glb, 8) == glb.size());
  assert(glb.size() % 4 == 0);
  const auto json_len = ReadU32(glb, 12);
  assert(glb.substr(16, 4) == "JSON");
  const auto json = glb.substr(20, json_len);
  assert(json.find("\"asset\"") != std::string::npos);
  assert(json.find("room:kitchen") != std::string::npos);
  assert(glb.substr(20 + json_len + 4, 3) == std::string("BIN"));
}

void TestRegistryLookupIsCaseInsensitive() {
  auto registry = plancast::modeling::MeshWriterRegistry::WithDefaults();
  assert(registry->Find("GLB") != nullptr);
  assert(registry->Find(".obj") != nullptr);
  assert(registry->Find("fbx") == nullptr);
  assert(registry->Formats().size() == 3);
  assert(plancast::modeling::NormalizeFormat(".STL") == "stl");
}

void TestExportIsolatesFormatFailures() {
  auto         store = TempStore("export");
  ModelBuilder builder(ModelBuilderOptions{}, store);
  const auto   model = builder.Build(RoomAndWall());

  const auto result = builder.Export(42, model, {"GLB", "obj", "fbx", "obj"});
  assert(result.files.size() == 2);
  assert(result.files.count("glb") == 1);
  assert(result.files.count("obj") == 1);
  assert(result.failures.size() == 1);
  assert(result.failures.at("fbx").find("unsupported export format") != std::string::npos);

  assert(store->Exists(result.files.at("glb")));
  assert(result.files.at("obj").filename() == "model.obj");
  assert(result.files.at("obj").parent_path().filename() == "42");

  auto registry = plancast::modeling::MeshWriterRegistry::WithDefaults();
  registry->Register(std::make_shared<BrokenWriter>());
  ModelBuilder partial(ModelBuilderOptions{}, store, registry);

  const auto mixed = partial.Export(43, model, {"obj", "stl"});
  assert(mixed.files.size() == 1 && mixed.files.count("stl") == 1);
  assert(mixed.failures.at("obj").find("writer exploded") != std::string::npos);
  assert(!store->Exists(store->root() / "projects" / "43" / "model.obj"));
}

} // namespace

int main() {
  TestTriangulateConcavePolygon();
  TestBuildExtrudesRoomsAndWalls();
  TestBuildRejectsEmptyAndShortWalls();
  TestWritersProduceWellFormedFiles();
  TestRegistryLookupIsCaseInsensitive();
  TestExportIsolatesFormatFailures();

  std::cout << "plancast_unit_model_builder: pass\n";
  return 0;
}
