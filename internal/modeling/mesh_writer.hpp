#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/geometry.hpp"

namespace plancast::modeling {

/*
  Encodes a Model3D into one file format. Model space is Z-up; writers
  for Y-up formats convert.
*/
class MeshWriter {
 public:
  virtual ~MeshWriter() = default;

  // Lowercase format name, also the file extension.
  virtual std::string Format() const = 0;

  virtual std::string Encode(const model::Model3D& model) const = 0;
};

class ObjWriter final : public MeshWriter {
 public:
  std::string Format() const override {
    return "obj";
  }
  std::string Encode(const model::Model3D& model) const override;
};

// Binary STL.
class StlWriter final : public MeshWriter {
 public:
  std::string Format() const override {
    return "stl";
  }
  std::string Encode(const model::Model3D& model) const override;
};

// glTF 2.0 binary container, one node per mesh.
class GlbWriter final : public MeshWriter {
 public:
  std::string Format() const override {
    return "glb";
  }
  std::string Encode(const model::Model3D& model) const override;
};

class MeshWriterRegistry {
 public:
  // glb, obj and stl.
  static std::shared_ptr<MeshWriterRegistry> WithDefaults();

  // Replaces any writer with the same format.
  void Register(std::shared_ptr<const MeshWriter> writer);

  // nullptr when the format is unknown; lookup is case-insensitive.
  const MeshWriter* Find(const std::string& format) const;

  std::vector<std::string> Formats() const;

 private:
  std::map<std::string, std::shared_ptr<const MeshWriter>> writers_;
};

std::string NormalizeFormat(const std::string& format);

} // namespace plancast::modeling
