#include "geom/PlateBuilder.hpp"
#include "geom/Topology.hpp"
#include "core/errors.hpp"

#include <string>
#include <utility>

namespace lamp::geom {

using lamp::Vec3;

Mesh build_plate(const PlateParams& p, const HeightfieldSampler& sampler) {
  if (!(p.width > 0.0) || !(p.depth > 0.0))
    throw lamp::ConfigurationError("plate width and depth must be > 0");
  if (p.columns < 1 || p.rows < 1)
    throw lamp::ConfigurationError("plate columns and rows must be >= 1, got " +
                                   std::to_string(p.columns) + "x" + std::to_string(p.rows));

  const int C = p.columns, R = p.rows;
  const std::uint32_t layer = static_cast<std::uint32_t>((C + 1) * (R + 1));
  std::vector<Vec3> verts(2 * static_cast<std::size_t>(layer));
  for (int r = 0; r <= R; ++r) {
    for (int c = 0; c <= C; ++c) {
      const double fx = static_cast<double>(c) / C, fy = static_cast<double>(r) / R;
      const double x = (fx - 0.5) * p.width, y = (fy - 0.5) * p.depth;
      const std::size_t k = static_cast<std::size_t>(r) * (C + 1) + c;
      verts[k] = {x, y, sampler.sample_xy(fx, fy)};
      verts[layer + k] = {x, y, 0.0};
    }
  }
  auto top = [&](int c, int r) { return static_cast<std::uint32_t>(r * (C + 1) + c); };
  auto bot = [&](int c, int r) { return layer + top(c, r); };

  std::vector<Face> faces;
  for (int r = 0; r < R; ++r) {
    for (int c = 0; c < C; ++c) {
      faces.push_back({top(c, r), top(c+1, r), top(c+1, r+1)});
      faces.push_back({top(c, r), top(c+1, r+1), top(c, r+1)});
      faces.push_back({bot(c, r), bot(c+1, r+1), bot(c+1, r)});
      faces.push_back({bot(c, r), bot(c, r+1), bot(c+1, r+1)});
    }
  }

  // Perimeter walked counter-clockwise seen from +Z
  std::vector<std::pair<int,int>> loop;
  for (int c = 0; c < C; ++c) loop.push_back({c, 0});
  for (int r = 0; r < R; ++r) loop.push_back({C, r});
  for (int c = C; c > 0; --c) loop.push_back({c, R});
  for (int r = R; r > 0; --r) loop.push_back({0, r});
  for (std::size_t k = 0; k < loop.size(); ++k) {
    auto [pc, pr] = loop[k];
    auto [qc, qr] = loop[(k + 1) % loop.size()];
    faces.push_back({bot(pc, pr), bot(qc, qr), top(qc, qr)});
    faces.push_back({bot(pc, pr), top(qc, qr), top(pc, pr)});
  }

  Mesh mesh(std::move(verts), std::move(faces));
  require_closed_solid(mesh, "plate mesh");
  return mesh;
}

} // namespace lamp::geom
