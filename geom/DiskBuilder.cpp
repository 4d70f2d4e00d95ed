#include "geom/DiskBuilder.hpp"
#include "geom/Topology.hpp"
#include "core/errors.hpp"
#include "core/units.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lamp::geom {

using lamp::Vec3;

void validate(const DiskParams& p) {
  const double tol = lamp::units::radius_eps * std::max(1.0, std::abs(p.outer_radius));
  if (std::abs(p.outer_radius - p.hole_radius) <= tol)
    throw lamp::GeometryError("hole_radius equals outer_radius (" + std::to_string(p.hole_radius) +
                              "): the annulus has zero width");
  if (!(p.hole_radius > 0.0))
    throw lamp::ConfigurationError("hole_radius must be > 0, got " + std::to_string(p.hole_radius));
  if (!(p.outer_radius > p.hole_radius))
    throw lamp::ConfigurationError("outer_radius (" + std::to_string(p.outer_radius) +
                                   ") must exceed hole_radius (" + std::to_string(p.hole_radius) + ")");
  if (p.radial_segments < 1)
    throw lamp::ConfigurationError("radial_segments must be >= 1, got " + std::to_string(p.radial_segments));
  if (p.angular_segments < 3)
    throw lamp::ConfigurationError("angular_segments must be >= 3, got " + std::to_string(p.angular_segments));
}

Mesh build_disk(const DiskParams& p, const HeightfieldSampler& sampler) {
  validate(p);

  const int R = p.radial_segments;
  const int A = p.angular_segments;
  const std::uint32_t ring_size = static_cast<std::uint32_t>(R + 1) * A;

  std::vector<Vec3> verts;
  verts.resize(2 * static_cast<std::size_t>(ring_size));
  // top(i,j) at i*A + j, bottom(i,j) at ring_size + i*A + j
  for (int i = 0; i <= R; ++i) {
    const double u = static_cast<double>(i) / R;
    const double r = (i == R) ? p.outer_radius : p.hole_radius + (p.outer_radius - p.hole_radius) * u;
    for (int j = 0; j < A; ++j) {
      const double v = static_cast<double>(j) / A;
      const double th = 2.0 * lamp::units::pi * v;
      const double x = r * std::cos(th), y = r * std::sin(th);
      const std::size_t k = static_cast<std::size_t>(i) * A + j;
      verts[k] = {x, y, sampler.sample(u, v)};
      verts[ring_size + k] = {x, y, 0.0};
    }
  }

  auto top = [&](int i, int j) { return static_cast<std::uint32_t>(i * A + (j % A)); };
  auto bot = [&](int i, int j) { return ring_size + top(i, j); };

  std::vector<Face> faces;
  faces.reserve(4 * static_cast<std::size_t>(A) * (R + 1));
  for (int i = 0; i < R; ++i) {
    for (int j = 0; j < A; ++j) {
      // radial step then angular step turns counter-clockwise seen from +Z
      std::uint32_t a = top(i, j), b = top(i+1, j), c = top(i+1, j+1), d = top(i, j+1);
      faces.push_back({a, b, c});
      faces.push_back({a, c, d});
      a = bot(i, j); b = bot(i+1, j); c = bot(i+1, j+1); d = bot(i, j+1);
      faces.push_back({a, c, b});
      faces.push_back({a, d, c});
    }
  }
  for (int j = 0; j < A; ++j) {
    // outer rim faces +r
    faces.push_back({bot(R, j), bot(R, j+1), top(R, j+1)});
    faces.push_back({bot(R, j), top(R, j+1), top(R, j)});
    // inner rim faces the axis
    faces.push_back({bot(0, j), top(0, j+1), bot(0, j+1)});
    faces.push_back({bot(0, j), top(0, j), top(0, j+1)});
  }

  Mesh mesh(std::move(verts), std::move(faces));
  require_closed_solid(mesh, "disk mesh");
  return mesh;
}

} // namespace lamp::geom
