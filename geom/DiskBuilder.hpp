// Closed annular relief disk (lamp shade plate) from a heightfield
#pragma once

#include "geom/HeightfieldSampler.hpp"
#include "geom/Mesh.hpp"

namespace lamp::geom {

struct DiskParams {
  double outer_radius{60.0};  // [mm]
  double hole_radius{20.0};   // [mm], 0 < hole < outer
  int radial_segments{64};    // rings between hole and rim, >= 1
  int angular_segments{256};  // columns around the axis, >= 3
};

// Throws lamp::GeometryError when the hole radius equals the outer radius
// (checked first) and lamp::ConfigurationError for other invalid parameters.
void validate(const DiskParams& p);

// Top relief, flat bottom at z = 0, outer and inner rims. The result is
// checked to be a closed manifold with outward normals; lamp::GeometryError otherwise.
Mesh build_disk(const DiskParams& p, const HeightfieldSampler& sampler);

} // namespace lamp::geom
