#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include "core/errors.hpp"
#include "geom/DiskBuilder.hpp"
#include "geom/Topology.hpp"
#include "image/ImageGrid.hpp"
#include "scene/Scene.hpp"

using lamp::geom::DiskParams;
using lamp::geom::HeightfieldSampler;
using lamp::geom::HeightParams;
using lamp::image::ImageGrid;

static int fail(const std::string& msg) { std::cerr << msg << "\n"; return 1; }

static ImageGrid noise_image(int w, int h, unsigned seed) {
  ImageGrid img(w, h);
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> u(0.0f, 1.0f);
  for (auto& p : img.pixels) p = u(rng);
  img.pixels[0] = 1.0f;
  return img;
}

static lamp::geom::Mesh build(const ImageGrid& img, const DiskParams& d, double base, double relief) {
  HeightParams p; p.base_thickness = base; p.relief_scale = relief;
  p.hole_fraction = d.hole_radius / d.outer_radius;
  HeightfieldSampler s(img, p);
  return lamp::geom::build_disk(d, s);
}

int main() {
  ImageGrid noise = noise_image(32, 32, 7);

  // Closed, outward, non-degenerate for a spread of annuli and resolutions
  const DiskParams cases[] = {
    {60.0, 20.0, 8, 64}, {60.0, 59.0, 1, 3}, {10.0, 0.5, 3, 7}, {200.0, 100.0, 16, 128}
  };
  for (const auto& d : cases) {
    auto m = build(noise, d, 1.0, 5.0);
    auto rep = lamp::geom::check_topology(m);
    std::string tag = " (outer=" + std::to_string(d.outer_radius) + ", hole=" + std::to_string(d.hole_radius) + ")";
    if (!rep.watertight()) return fail("disk not watertight" + tag);
    for (std::size_t i = 0; i < m.face_count(); ++i)
      if (!(m.area(i) > 0.0)) return fail("zero-area face" + tag);
    if (!(lamp::geom::signed_volume(m) > 0.0)) return fail("disk normals point inward" + tag);

    const std::size_t A = d.angular_segments, R = d.radial_segments;
    if (m.vertex_count() != 2 * (R + 1) * A) return fail("unexpected vertex count" + tag);
    if (m.face_count() != 4 * A * (R + 1)) return fail("unexpected face count" + tag);

    // Euler characteristic of a solid ring (torus) is 0
    long long chi = static_cast<long long>(m.vertex_count()) - static_cast<long long>(rep.edges) +
                    static_cast<long long>(m.face_count());
    if (chi != 0) return fail("Euler characteristic " + std::to_string(chi) + tag);

    double zmin_top = 1e300, zmax = -1e300;
    for (const auto& v : m.vertices()) {
      double r = std::hypot(v.x, v.y);
      if (r < d.hole_radius - 1e-9 || r > d.outer_radius + 1e-9) return fail("vertex outside annulus" + tag);
      if (v.z > 0.0) zmin_top = std::min(zmin_top, v.z);
      zmax = std::max(zmax, v.z);
    }
    if (zmin_top < 1.0 - 1e-12) return fail("top below base thickness" + tag);
    if (zmax > 6.0 + 1e-12) return fail("top above base + relief" + tag);
  }

  // White image: every top vertex at base + relief
  {
    ImageGrid white(64, 64, 1.0f);
    auto m = build(white, {60.0, 20.0, 4, 32}, 1.0, 5.0);
    for (const auto& v : m.vertices())
      if (!(std::abs(v.z) < 1e-12 || std::abs(v.z - 6.0) < 1e-9)) return fail("white disk height " + std::to_string(v.z));
  }

  // Minimal ring still closes
  {
    auto m = build(noise, {30.0, 10.0, 1, 3}, 0.5, 2.0);
    if (!lamp::geom::check_topology(m).watertight()) return fail("3x1 disk not watertight");
    if (m.face_count() != 24) return fail("3x1 disk face count");
  }

  // Independent calls yield identical meshes
  {
    auto a = build(noise, {60.0, 20.0, 4, 16}, 1.0, 5.0);
    auto b = build(noise, {60.0, 20.0, 4, 16}, 1.0, 5.0);
    if (a.vertices().size() != b.vertices().size()) return fail("repeat build differs");
    for (std::size_t i = 0; i < a.vertex_count(); ++i) {
      if (a.vertices()[i].z != b.vertices()[i].z) return fail("repeat build differs");
    }
  }

  // hole == outer is a geometry error, raised before the image is even looked at
  {
    bool geometry = false;
    try { lamp::geom::validate({40.0, 40.0, 4, 16}); }
    catch (const lamp::GeometryError&) { geometry = true; }
    if (!geometry) return fail("hole == outer did not raise GeometryError");

    lamp::scene::GeneratorConfig cfg;
    cfg.disk = {40.0, 40.0, 4, 16};
    ImageGrid empty;
    geometry = false;
    try { lamp::scene::generate(empty, cfg); }
    catch (const lamp::GeometryError&) { geometry = true; }
    if (!geometry) return fail("generate: hole == outer did not raise GeometryError first");
  }

  // Other invalid parameters are configuration errors
  {
    const DiskParams bad[] = {
      {20.0, 40.0, 4, 16}, {40.0, 0.0, 4, 16}, {40.0, -5.0, 4, 16}, {40.0, 10.0, 0, 16}, {40.0, 10.0, 4, 2}
    };
    for (const auto& d : bad) {
      bool config = false;
      try { build(noise, d, 1.0, 5.0); }
      catch (const lamp::ConfigurationError&) { config = true; }
      if (!config) return fail("invalid disk accepted: outer=" + std::to_string(d.outer_radius) +
                               " hole=" + std::to_string(d.hole_radius));
    }
  }

  return 0;
}
