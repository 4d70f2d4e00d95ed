#include "geom/Topology.hpp"
#include "core/errors.hpp"

#include <sstream>
#include <utility>
#include <unordered_map>

namespace lamp::geom {

using lamp::Vec3;

namespace {

struct EdgeUse {
  int forward{0};  // traversed low -> high
  int backward{0}; // traversed high -> low
};

inline std::uint64_t edge_key(std::uint32_t a, std::uint32_t b) {
  if (a > b) std::swap(a, b);
  return (static_cast<std::uint64_t>(a) << 32) | b;
}

} // namespace

TopologyReport check_topology(const Mesh& mesh, double area_eps) {
  TopologyReport rep{};
  std::unordered_map<std::uint64_t, EdgeUse> edges;
  edges.reserve(mesh.face_count() * 2);

  for (std::size_t i = 0; i < mesh.face_count(); ++i) {
    const Face& f = mesh.faces()[i];
    if (f[0] == f[1] || f[1] == f[2] || f[0] == f[2] || mesh.area(i) <= area_eps) {
      rep.degenerate_faces++;
    }
    for (int k = 0; k < 3; ++k) {
      std::uint32_t a = f[k], b = f[(k + 1) % 3];
      if (a == b) continue;
      auto& use = edges[edge_key(a, b)];
      if (a < b) use.forward++; else use.backward++;
    }
  }

  rep.edges = edges.size();
  for (const auto& kv : edges) {
    const EdgeUse& u = kv.second;
    int total = u.forward + u.backward;
    if (total == 1) rep.open_edges++;
    else if (total > 2) rep.nonmanifold_edges++;
    else if (u.forward != 1) rep.misoriented_edges++;
  }
  return rep;
}

double signed_volume(const Mesh& mesh) {
  double v6 = 0.0;
  for (std::size_t i = 0; i < mesh.face_count(); ++i) {
    const Triangle t = mesh.triangle(i);
    v6 += Vec3::dot(t.v0, Vec3::cross(t.v1, t.v2));
  }
  return v6 / 6.0;
}

void require_closed_solid(const Mesh& mesh, const char* what) {
  TopologyReport rep = check_topology(mesh);
  if (!rep.watertight()) {
    std::ostringstream ss;
    ss << what << " is not a closed manifold: open=" << rep.open_edges
       << " nonmanifold=" << rep.nonmanifold_edges
       << " misoriented=" << rep.misoriented_edges
       << " degenerate=" << rep.degenerate_faces;
    throw lamp::GeometryError(ss.str());
  }
  if (!(signed_volume(mesh) > 0.0)) {
    throw lamp::GeometryError(std::string(what) + " has inward-facing normals");
  }
}

} // namespace lamp::geom
