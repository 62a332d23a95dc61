#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/geometry/sidecar_geometry_extractor.hpp"
#include "internal/util/errors.hpp"

namespace {

using plancast::geometry::SidecarGeometryExtractor;

std::filesystem::path Dir() {
  const auto dir = std::filesystem::temp_directory_path() / "plancast_sidecar_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteImage(const std::string& name, const std::string& sidecar_json, const std::string& suffix = ".geometry.json") {
  const auto image = Dir() / name;
  std::ofstream(image) << "not really a png";
  std::filesystem::remove(image.string() + suffix);
  if (!sidecar_json.empty()) std::ofstream(image.string() + suffix) << sidecar_json;
  return image;
}

std::string ExpectExtractionError(SidecarGeometryExtractor& extractor, const std::filesystem::path& image) {
  try {
    (void)extractor.Extract(image);
  } catch (const plancast::util::GeometryExtractionError& e) {
    return e.what();
  }
  assert(false && "expected GeometryExtractionError");
  return {};
}

void TestParsesRoomsWallsAndEmbeddedReference() {
  const auto image = WriteImage("plan.png", R"({
    "rooms": [{"name": "kitchen", "points": [{"x": 0, "y": 0}, {"x": 120, "y": 0}, {"x": 120, "y": 80}]}],
    "walls": [{"start": {"x": 0, "y": 0}, "end": {"x": 120, "y": 0}}],
    "scaleReference": {"length": {"pixelLength": 120, "realLength": 3.0}},
    "image_width": 640,
    "imageHeight": 480,
    "confidence": 0.93
  })");

  SidecarGeometryExtractor extractor;
  const auto               raw = extractor.Extract(image);

  assert(raw.rooms.size() == 1);
  assert(raw.rooms[0].name == "kitchen");
  assert(raw.rooms[0].points.size() == 3);
  assert(raw.rooms[0].points[2].y == 80.0);
  assert(raw.walls.size() == 1 && raw.walls[0].end.x == 120.0);
  assert(raw.image_width == 640 && raw.image_height == 480);
  assert(raw.scale_reference.has_value());
  assert(raw.scale_reference->length().real_length() == 3.0);
}

void TestCustomSuffix() {
  const auto image = WriteImage("custom.jpg", R"({"walls": [{"start": {"x": 1, "y": 1}, "end": {"x": 5, "y": 1}}]})", ".seg");

  SidecarGeometryExtractor extractor({".seg"});
  assert(extractor.SidecarPath(image).string() == image.string() + ".seg");
  const auto raw = extractor.Extract(image);
  assert(raw.rooms.empty() && raw.walls.size() == 1);
  assert(!raw.scale_reference.has_value());
}

void TestFailuresAreExtractionErrors() {
  SidecarGeometryExtractor extractor;

  assert(ExpectExtractionError(extractor, Dir() / "missing.png").find("not found") != std::string::npos);
  assert(ExpectExtractionError(extractor, WriteImage("nosidecar.png", "")).find("no segmentation result") != std::string::npos);
  assert(ExpectExtractionError(extractor, WriteImage("garbage.png", "{not json")).find("malformed") != std::string::npos);
  assert(ExpectExtractionError(extractor, WriteImage("empty.png", "{}")).find("no rooms or walls") != std::string::npos);
  assert(ExpectExtractionError(extractor, WriteImage("nan.png", R"({"rooms": [{"name": "a", "points": [{"x": "NaN", "y": 0}]}]})"))
             .find("non-finite") != std::string::npos);
}

} // namespace

int main() {
  TestParsesRoomsWallsAndEmbeddedReference();
  TestCustomSuffix();
  TestFailuresAreExtractionErrors();

  std::cout << "plancast_unit_sidecar_geometry_extractor: pass\n";
  return 0;
}
