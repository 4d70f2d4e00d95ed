// Indexed, immutable triangle mesh with binary/ASCII STL exchange
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace lamp::geom {

struct Triangle { lamp::Vec3 v0, v1, v2; };

// Vertex indices; outward normal by the right-hand rule
using Face = std::array<std::uint32_t, 3>;

class Mesh {
public:
  Mesh() = default;
  // Throws lamp::ConfigurationError if a face references a missing vertex.
  Mesh(std::vector<lamp::Vec3> vertices, std::vector<Face> faces);

  static std::optional<Mesh> load(const std::string& path, std::string* err = nullptr);
  // Binary STL (size-checked), falling back to ASCII STL.
  static std::optional<Mesh> loadSTL(const std::string& path, std::string* err = nullptr);
  // Rebuild an indexed mesh from a triangle soup, merging bit-identical positions.
  static Mesh from_triangles(const std::vector<Triangle>& tris);

  bool saveSTL(const std::string& path, std::string* err = nullptr) const;

  const std::vector<lamp::Vec3>& vertices() const { return m_vertices; }
  const std::vector<Face>& faces() const { return m_faces; }
  std::size_t vertex_count() const { return m_vertices.size(); }
  std::size_t face_count() const { return m_faces.size(); }
  bool empty() const { return m_faces.empty(); }

  Triangle triangle(std::size_t i) const;
  std::vector<Triangle> triangles() const;
  // Unit normal; +Z for a zero-area face
  lamp::Vec3 normal(std::size_t i) const;
  double area(std::size_t i) const;
  lamp::Bounds bounds() const;

private:
  std::vector<lamp::Vec3> m_vertices;
  std::vector<Face> m_faces;
};

} // namespace lamp::geom
