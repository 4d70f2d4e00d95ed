#include "geom/Mesh.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace lamp::geom {

using lamp::Vec3;

namespace {

constexpr std::size_t kHeaderBytes = 80;
constexpr std::size_t kFacetBytes = 50;
constexpr char kHeaderText[] = "lampshade binary STL";

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

void put_u32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFFu));
}

void put_f32(std::string& out, double v) {
  float f = static_cast<float>(v);
  std::uint32_t bits; std::memcpy(&bits, &f, sizeof bits);
  put_u32(out, bits);
}

void put_vec(std::string& out, const Vec3& v) { put_f32(out, v.x); put_f32(out, v.y); put_f32(out, v.z); }

std::uint32_t get_u32(const unsigned char* p) {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

double get_f32(const unsigned char* p) {
  std::uint32_t bits = get_u32(p);
  float f; std::memcpy(&f, &bits, sizeof f);
  return static_cast<double>(f);
}

Vec3 get_vec(const unsigned char* p) { return {get_f32(p), get_f32(p + 4), get_f32(p + 8)}; }

struct PosKey {
  double x, y, z;
  bool operator==(const PosKey& o) const { return x == o.x && y == o.y && z == o.z; }
};

struct PosKeyHash {
  size_t operator()(const PosKey& k) const {
    auto bits = [](double d) { std::uint64_t b; std::memcpy(&b, &d, sizeof b); return b; };
    auto h1 = std::hash<std::uint64_t>{}(bits(k.x));
    auto h2 = std::hash<std::uint64_t>{}(bits(k.y));
    auto h3 = std::hash<std::uint64_t>{}(bits(k.z));
    return ((h1 * 1315423911u) ^ h2) * 2654435761u ^ h3;
  }
};

std::optional<Mesh> parse_ascii(const std::string& text, const std::string& path, std::string* err) {
  std::istringstream in(text);
  std::vector<Triangle> tris;
  std::string tok;
  while (in >> tok) {
    if (tok != "facet") continue;
    std::string normal_label; double nx, ny, nz;
    in >> normal_label >> nx >> ny >> nz;
    std::string outer, loop; in >> outer >> loop;
    Vec3 v[3];
    for (int k = 0; k < 3; ++k) {
      std::string vertex; in >> vertex >> v[k].x >> v[k].y >> v[k].z;
      if (!in || vertex != "vertex") {
        if (err) *err = "Malformed ASCII STL facet " + std::to_string(tris.size()) + ": " + path;
        return std::nullopt;
      }
    }
    std::string endloop, endfacet; in >> endloop >> endfacet;
    tris.push_back({v[0], v[1], v[2]});
  }
  if (tris.empty()) {
    if (err) *err = "No triangles parsed from ASCII STL: " + path;
    return std::nullopt;
  }
  return Mesh::from_triangles(tris);
}

} // namespace

Mesh::Mesh(std::vector<Vec3> vertices, std::vector<Face> faces)
  : m_vertices(std::move(vertices)), m_faces(std::move(faces)) {
  for (const auto& f : m_faces) {
    for (auto idx : f) {
      if (idx >= m_vertices.size())
        throw lamp::ConfigurationError("Face references vertex " + std::to_string(idx) +
                                       " of " + std::to_string(m_vertices.size()));
    }
  }
}

std::optional<Mesh> Mesh::load(const std::string& path, std::string* err) {
  auto lower = to_lower(path);
  if (lower.size() >= 4 && lower.substr(lower.size()-4) == ".stl")
    return loadSTL(path, err);
  if (err) *err = "Unsupported mesh extension: " + path;
  return std::nullopt;
}

std::optional<Mesh> Mesh::loadSTL(const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { if (err) *err = "Failed to open STL: " + path + ": " + std::strerror(errno); return std::nullopt; }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  if (data.size() >= kHeaderBytes + 4) {
    auto bytes = reinterpret_cast<const unsigned char*>(data.data());
    const std::uint64_t count = get_u32(bytes + kHeaderBytes);
    const std::uint64_t expected = kHeaderBytes + 4 + count * kFacetBytes;
    if (expected == data.size()) {
      std::vector<Triangle> tris;
      tris.reserve(static_cast<std::size_t>(count));
      const unsigned char* p = bytes + kHeaderBytes + 4;
      for (std::uint64_t i = 0; i < count; ++i, p += kFacetBytes) {
        // stored normal at p is recomputed from winding
        tris.push_back({get_vec(p + 12), get_vec(p + 24), get_vec(p + 36)});
      }
      return from_triangles(tris);
    }
    if (data.compare(0, 5, "solid") != 0) {
      if (err) *err = "Truncated binary STL: " + path + " has " + std::to_string(data.size()) +
                      " bytes, header announces " + std::to_string(count) + " facets (" +
                      std::to_string(expected) + " bytes)";
      return std::nullopt;
    }
  } else if (data.compare(0, 5, "solid") != 0) {
    if (err) *err = "File too short for binary STL: " + path;
    return std::nullopt;
  }
  return parse_ascii(data, path, err);
}

Mesh Mesh::from_triangles(const std::vector<Triangle>& tris) {
  std::vector<Vec3> verts;
  std::vector<Face> faces;
  faces.reserve(tris.size());
  std::unordered_map<PosKey, std::uint32_t, PosKeyHash> index;
  auto intern = [&](const Vec3& v) {
    PosKey k{v.x + 0.0, v.y + 0.0, v.z + 0.0}; // folds -0.0 into +0.0
    auto it = index.find(k);
    if (it != index.end()) return it->second;
    auto id = static_cast<std::uint32_t>(verts.size());
    verts.push_back({k.x, k.y, k.z});
    index.emplace(k, id);
    return id;
  };
  for (const auto& t : tris) faces.push_back({intern(t.v0), intern(t.v1), intern(t.v2)});
  return Mesh(std::move(verts), std::move(faces));
}

bool Mesh::saveSTL(const std::string& path, std::string* err) const {
  std::string out;
  out.reserve(kHeaderBytes + 4 + m_faces.size() * kFacetBytes);
  out.append(kHeaderText);
  out.resize(kHeaderBytes, ' ');
  put_u32(out, static_cast<std::uint32_t>(m_faces.size()));
  for (std::size_t i = 0; i < m_faces.size(); ++i) {
    const Triangle t = triangle(i);
    put_vec(out, normal(i));
    put_vec(out, t.v0); put_vec(out, t.v1); put_vec(out, t.v2);
    out.push_back('\0'); out.push_back('\0');
  }
  std::ofstream of(path, std::ios::binary);
  if (!of) { if (err) *err = "Failed to open for writing: " + path + ": " + std::strerror(errno); return false; }
  of.write(out.data(), static_cast<std::streamsize>(out.size()));
  if (!of) { if (err) *err = "Failed to write STL: " + path + ": " + std::strerror(errno); return false; }
  return true;
}

Triangle Mesh::triangle(std::size_t i) const {
  const Face& f = m_faces[i];
  return {m_vertices[f[0]], m_vertices[f[1]], m_vertices[f[2]]};
}

std::vector<Triangle> Mesh::triangles() const {
  std::vector<Triangle> tris;
  tris.reserve(m_faces.size());
  for (std::size_t i = 0; i < m_faces.size(); ++i) tris.push_back(triangle(i));
  return tris;
}

Vec3 Mesh::normal(std::size_t i) const {
  const Triangle t = triangle(i);
  Vec3 n = Vec3::cross(t.v1 - t.v0, t.v2 - t.v0);
  double len = n.norm();
  return (len > 0.0) ? (n / len) : Vec3{0,0,1};
}

double Mesh::area(std::size_t i) const {
  const Triangle t = triangle(i);
  return 0.5 * Vec3::cross(t.v1 - t.v0, t.v2 - t.v0).norm();
}

lamp::Bounds Mesh::bounds() const {
  lamp::Bounds b;
  for (const auto& v : m_vertices) b.expand(v);
  return b;
}

} // namespace lamp::geom
