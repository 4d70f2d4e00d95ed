// Closed rectangular relief block, the flat-panel variant of the shade
#pragma once

#include "geom/HeightfieldSampler.hpp"
#include "geom/Mesh.hpp"

namespace lamp::geom {

struct PlateParams {
  double width{100.0};  // along X [mm]
  double depth{100.0};  // along Y [mm]
  int columns{100};     // >= 1
  int rows{100};        // >= 1
};

// Centred on the origin, bottom at z = 0, top sampled with sample_xy.
Mesh build_plate(const PlateParams& p, const HeightfieldSampler& sampler);

} // namespace lamp::geom
