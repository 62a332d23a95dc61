#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>

#include "internal/modeling/mesh_writer.hpp"

namespace plancast::modeling {

namespace {

constexpr std::uint32_t kGlbMagic     = 0x46546C67; // "glTF"
constexpr std::uint32_t kGlbVersion   = 2;
constexpr std::uint32_t kChunkJson    = 0x4E4F534A;
constexpr std::uint32_t kChunkBin     = 0x004E4942;
constexpr int           kFloat        = 5126;
constexpr int           kUnsignedInt  = 5125;
constexpr int           kArrayBuffer  = 34962;
constexpr int           kElementArray = 34963;
constexpr int           kTriangles    = 4;

void AppendU32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void AppendU16(std::string& out, std::uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void AppendF32(std::string& out, float v) {
  std::uint32_t bits;
  static_assert(sizeof(bits) == sizeof(v));
  std::memcpy(&bits, &v, sizeof(bits));
  AppendU32(out, bits);
}

void PatchU32(std::string& out, std::size_t offset, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out[offset + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
}

// Z-up model space to Y-up (right-handed) output space.
model::Vertex3 ToYUp(const model::Vertex3& v) {
  return {v.x, v.z, -v.y};
}

model::Vertex3 Sub(const model::Vertex3& a, const model::Vertex3& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

model::Vertex3 UnitNormal(const model::Vertex3& a, const model::Vertex3& b, const model::Vertex3& c) {
  const auto u = Sub(b, a);
  const auto v = Sub(c, a);
  model::Vertex3 n{u.y * v.z - u.z * v.y, u.z * v.x - u.x * v.z, u.x * v.y - u.y * v.x};
  const double len = std::sqrt(n.x * n.x + n.y * n.y + n.z * n.z);
  if (len > 0) n = {n.x / len, n.y / len, n.z / len};
  return n;
}

void CheckIndices(const model::Mesh& mesh) {
  for (const auto& t : mesh.triangles) {
    if (t.a >= mesh.vertices.size() || t.b >= mesh.vertices.size() || t.c >= mesh.vertices.size()) {
      throw std::out_of_range("mesh '" + mesh.name + "' has a triangle index out of range");
    }
  }
}

google::protobuf::Value Num(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

google::protobuf::Value Str(const std::string& s) {
  google::protobuf::Value value;
  value.set_string_value(s);
  return value;
}

google::protobuf::Value Obj(google::protobuf::Struct s) {
  google::protobuf::Value value;
  *value.mutable_struct_value() = std::move(s);
  return value;
}

google::protobuf::Value List(std::vector<google::protobuf::Value> items) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (auto& item : items) *list->add_values() = std::move(item);
  return value;
}

void Set(google::protobuf::Struct& s, const std::string& key, google::protobuf::Value value) {
  (*s.mutable_fields())[key] = std::move(value);
}

} // namespace

std::string NormalizeFormat(const std::string& format) {
  std::string out = format;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!out.empty() && out.front() == '.') out.erase(out.begin());
  return out;
}

// ------------------------------------------------------------------
// OBJ
// ------------------------------------------------------------------

std::string ObjWriter::Encode(const model::Model3D& model) const {
  std::string out = "# plancast\n";
  out += fmt::format("# vertices {} triangles {}\n", model.VertexCount(), model.TriangleCount());

  std::size_t base = 1;
  for (const auto& mesh : model.meshes) {
    CheckIndices(mesh);
    out += fmt::format("o {}\n", mesh.name.empty() ? "mesh" : mesh.name);
    for (const auto& v : mesh.vertices) {
      const auto p = ToYUp(v);
      out += fmt::format("v {:.6f} {:.6f} {:.6f}\n", p.x, p.y, p.z);
    }
    for (const auto& t : mesh.triangles) {
      out += fmt::format("f {} {} {}\n", base + t.a, base + t.b, base + t.c);
    }
    base += mesh.vertices.size();
  }
  return out;
}

// ------------------------------------------------------------------
// STL (binary): 80-byte header, uint32 count, 50 bytes per triangle
// ------------------------------------------------------------------

std::string StlWriter::Encode(const model::Model3D& model) const {
  const auto count = model.TriangleCount();
  if (count > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("too many triangles for STL");
  }

  std::string out;
  out.reserve(84 + count * 50);

  std::string header = "plancast binary stl";
  header.resize(80, '\0');
  out += header;
  AppendU32(out, static_cast<std::uint32_t>(count));

  for (const auto& mesh : model.meshes) {
    CheckIndices(mesh);
    for (const auto& t : mesh.triangles) {
      const auto& a = mesh.vertices[t.a];
      const auto& b = mesh.vertices[t.b];
      const auto& c = mesh.vertices[t.c];
      const auto  n = UnitNormal(a, b, c);

      for (const auto& v : {n, a, b, c}) {
        AppendF32(out, static_cast<float>(v.x));
        AppendF32(out, static_cast<float>(v.y));
        AppendF32(out, static_cast<float>(v.z));
      }
      AppendU16(out, 0);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// GLB
// ------------------------------------------------------------------

std::string GlbWriter::Encode(const model::Model3D& model) const {
  std::string bin;

  std::vector<google::protobuf::Value> buffer_views;
  std::vector<google::protobuf::Value> accessors;
  std::vector<google::protobuf::Value> meshes;
  std::vector<google::protobuf::Value> nodes;
  std::vector<google::protobuf::Value> scene_nodes;

  for (const auto& mesh : model.meshes) {
    CheckIndices(mesh);
    if (mesh.vertices.empty() || mesh.triangles.empty()) continue;

    // positions
    const std::size_t pos_offset = bin.size();
    double            lo[3]      = {std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    double            hi[3]      = {std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    for (const auto& v : mesh.vertices) {
      const auto  p      = ToYUp(v);
      const float xyz[3] = {static_cast<float>(p.x), static_cast<float>(p.y), static_cast<float>(p.z)};
      for (int i = 0; i < 3; ++i) {
        AppendF32(bin, xyz[i]);
        lo[i] = std::min(lo[i], static_cast<double>(xyz[i]));
        hi[i] = std::max(hi[i], static_cast<double>(xyz[i]));
      }
    }
    const std::size_t pos_length = bin.size() - pos_offset;

    // indices
    const std::size_t idx_offset = bin.size();
    for (const auto& t : mesh.triangles) {
      AppendU32(bin, t.a);
      AppendU32(bin, t.b);
      AppendU32(bin, t.c);
    }
    const std::size_t idx_length = bin.size() - idx_offset;

    const double pos_view = static_cast<double>(buffer_views.size());
    {
      google::protobuf::Struct view;
      Set(view, "buffer", Num(0));
      Set(view, "byteOffset", Num(static_cast<double>(pos_offset)));
      Set(view, "byteLength", Num(static_cast<double>(pos_length)));
      Set(view, "target", Num(kArrayBuffer));
      buffer_views.push_back(Obj(std::move(view)));
    }
    const double idx_view = static_cast<double>(buffer_views.size());
    {
      google::protobuf::Struct view;
      Set(view, "buffer", Num(0));
      Set(view, "byteOffset", Num(static_cast<double>(idx_offset)));
      Set(view, "byteLength", Num(static_cast<double>(idx_length)));
      Set(view, "target", Num(kElementArray));
      buffer_views.push_back(Obj(std::move(view)));
    }

    const double pos_accessor = static_cast<double>(accessors.size());
    {
      google::protobuf::Struct accessor;
      Set(accessor, "bufferView", Num(pos_view));
      Set(accessor, "componentType", Num(kFloat));
      Set(accessor, "count", Num(static_cast<double>(mesh.vertices.size())));
      Set(accessor, "type", Str("VEC3"));
      Set(accessor, "min", List({Num(lo[0]), Num(lo[1]), Num(lo[2])}));
      Set(accessor, "max", List({Num(hi[0]), Num(hi[1]), Num(hi[2])}));
      accessors.push_back(Obj(std::move(accessor)));
    }
    const double idx_accessor = static_cast<double>(accessors.size());
    {
      google::protobuf::Struct accessor;
      Set(accessor, "bufferView", Num(idx_view));
      Set(accessor, "componentType", Num(kUnsignedInt));
      Set(accessor, "count", Num(static_cast<double>(mesh.triangles.size() * 3)));
      Set(accessor, "type", Str("SCALAR"));
      accessors.push_back(Obj(std::move(accessor)));
    }

    google::protobuf::Struct attributes;
    Set(attributes, "POSITION", Num(pos_accessor));

    google::protobuf::Struct primitive;
    Set(primitive, "attributes", Obj(std::move(attributes)));
    Set(primitive, "indices", Num(idx_accessor));
    Set(primitive, "mode", Num(kTriangles));

    google::protobuf::Struct gltf_mesh;
    Set(gltf_mesh, "name", Str(mesh.name));
    Set(gltf_mesh, "primitives", List({Obj(std::move(primitive))}));

    scene_nodes.push_back(Num(static_cast<double>(nodes.size())));

    google::protobuf::Struct node;
    Set(node, "mesh", Num(static_cast<double>(meshes.size())));
    Set(node, "name", Str(mesh.name));
    nodes.push_back(Obj(std::move(node)));
    meshes.push_back(Obj(std::move(gltf_mesh)));
  }

  if (meshes.empty()) {
    throw std::invalid_argument("model has no triangles");
  }

  google::protobuf::Struct asset;
  Set(asset, "version", Str("2.0"));
  Set(asset, "generator", Str("plancast"));

  google::protobuf::Struct buffer;
  Set(buffer, "byteLength", Num(static_cast<double>(bin.size())));

  google::protobuf::Struct scene;
  Set(scene, "nodes", List(std::move(scene_nodes)));

  google::protobuf::Struct root;
  Set(root, "asset", Obj(std::move(asset)));
  Set(root, "scene", Num(0));
  Set(root, "scenes", List({Obj(std::move(scene))}));
  Set(root, "nodes", List(std::move(nodes)));
  Set(root, "meshes", List(std::move(meshes)));
  Set(root, "accessors", List(std::move(accessors)));
  Set(root, "bufferViews", List(std::move(buffer_views)));
  Set(root, "buffers", List({Obj(std::move(buffer))}));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode glTF json: " + status.ToString());
  }

  while (json.size() % 4 != 0) json.push_back(' ');
  while (bin.size() % 4 != 0) bin.push_back('\0');

  std::string out;
  out.reserve(12 + 8 + json.size() + 8 + bin.size());
  AppendU32(out, kGlbMagic);
  AppendU32(out, kGlbVersion);
  AppendU32(out, 0); // total length, patched below

  AppendU32(out, static_cast<std::uint32_t>(json.size()));
  AppendU32(out, kChunkJson);
  out += json;

  AppendU32(out, static_cast<std::uint32_t>(bin.size()));
  AppendU32(out, kChunkBin);
  out += bin;

  PatchU32(out, 8, static_cast<std::uint32_t>(out.size()));
  return out;
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

std::shared_ptr<MeshWriterRegistry> MeshWriterRegistry::WithDefaults() {
  auto registry = std::make_shared<MeshWriterRegistry>();
  registry->Register(std::make_shared<GlbWriter>());
  registry->Register(std::make_shared<ObjWriter>());
  registry->Register(std::make_shared<StlWriter>());
  return registry;
}

void MeshWriterRegistry::Register(std::shared_ptr<const MeshWriter> writer) {
  auto format      = NormalizeFormat(writer->Format());
  writers_[format] = std::move(writer);
}

const MeshWriter* MeshWriterRegistry::Find(const std::string& format) const {
  auto it = writers_.find(NormalizeFormat(format));
  return it == writers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> MeshWriterRegistry::Formats() const {
  std::vector<std::string> out;
  out.reserve(writers_.size());
  for (const auto& [format, _] : writers_) out.push_back(format);
  return out;
}

} // namespace plancast::modeling
