// Manifold/orientation checks for closed triangle meshes
#pragma once

#include <cstddef>
#include "geom/Mesh.hpp"
#include "core/units.hpp"

namespace lamp::geom {

struct TopologyReport {
  std::size_t edges{0};
  std::size_t open_edges{0};         // used by a single face
  std::size_t nonmanifold_edges{0};  // used by more than two faces
  std::size_t misoriented_edges{0};  // two faces traverse it in the same direction
  std::size_t degenerate_faces{0};   // area below the tolerance or repeated index

  bool watertight() const {
    return open_edges == 0 && nonmanifold_edges == 0 && misoriented_edges == 0 && degenerate_faces == 0;
  }
};

TopologyReport check_topology(const Mesh& mesh, double area_eps = lamp::units::area_eps);

// Enclosed volume by the divergence theorem; positive when normals point outward.
double signed_volume(const Mesh& mesh);

// Throws lamp::GeometryError unless the mesh is watertight with outward normals.
void require_closed_solid(const Mesh& mesh, const char* what);

} // namespace lamp::geom
