#include <cmath>
#include <iostream>
#include <string>
#include "core/errors.hpp"
#include "geom/HeightfieldSampler.hpp"
#include "image/ImageGrid.hpp"

using lamp::geom::HeightfieldSampler;
using lamp::geom::HeightParams;
using lamp::geom::Interpolation;
using lamp::geom::Projection;
using lamp::image::ImageGrid;

static int fail(const std::string& msg) { std::cerr << msg << "\n"; return 1; }

template <class Fn>
static bool throws_config(Fn&& fn) {
  try { fn(); } catch (const lamp::ConfigurationError&) { return true; }
  return false;
}

int main() {
  auto near = [](double a, double b, double tol = 1e-9){ return std::abs(a - b) < tol; };

  // Uniform image: every sample sits at base + L * relief
  {
    ImageGrid img(16, 16, 0.5f);
    HeightParams p; p.base_thickness = 1.0; p.relief_scale = 4.0; p.hole_fraction = 0.25;
    HeightfieldSampler s(img, p);
    for (double u : {0.0, 0.3, 1.0})
      for (double v : {0.0, 0.49, 0.99})
        if (!near(s.sample(u, v), 3.0)) return fail("uniform sample not 3.0 at u=" + std::to_string(u));
    if (!near(s.sample(1.7, 0.2), 3.0)) return fail("out-of-range u not clamped");
  }

  // Invalid inputs
  {
    ImageGrid empty;
    ImageGrid img(4, 4, 1.0f);
    HeightParams p;
    if (!throws_config([&]{ HeightfieldSampler s(empty, p); })) return fail("empty image accepted");
    HeightParams zero_base = p; zero_base.base_thickness = 0.0;
    if (!throws_config([&]{ HeightfieldSampler s(img, zero_base); })) return fail("zero base accepted");
    HeightParams neg_relief = p; neg_relief.relief_scale = -1.0;
    if (!throws_config([&]{ HeightfieldSampler s(img, neg_relief); })) return fail("negative relief accepted");
    HeightParams full_hole = p; full_hole.hole_fraction = 1.0;
    if (!throws_config([&]{ HeightfieldSampler s(img, full_hole); })) return fail("hole fraction 1 accepted");
  }

  // Polar unwrap: columns follow the angle and wrap at 2*pi
  {
    ImageGrid img(4, 2);
    const float cols[4] = {0.0f, 0.25f, 0.5f, 0.75f};
    for (int y = 0; y < 2; ++y) for (int x = 0; x < 4; ++x) img.at(x, y) = cols[x];
    HeightParams p; p.base_thickness = 1.0; p.relief_scale = 1.0; p.projection = Projection::Polar;
    p.interpolation = Interpolation::Nearest;
    HeightfieldSampler nearest(img, p);
    if (!near(nearest.luminance(0.5, 0.1), 0.0)) return fail("polar nearest col 0");
    if (!near(nearest.luminance(0.5, 0.9), 0.75)) return fail("polar nearest col 3");
    p.interpolation = Interpolation::Bilinear;
    HeightfieldSampler bilinear(img, p);
    // 0.99 * 4 = 3.96 lies between column 3 and the wrapped column 0
    if (!near(bilinear.luminance(0.5, 0.99), 0.405, 1e-6))
      return fail("polar bilinear did not wrap: " + std::to_string(bilinear.luminance(0.5, 0.99)));
    if (!near(bilinear.luminance(0.5, 0.25), 0.125, 1e-6))
      return fail("polar bilinear midpoint: " + std::to_string(bilinear.luminance(0.5, 0.25)));
  }

  // Cartesian: the picture is seen from above, +Y towards the top row
  {
    ImageGrid img(2, 2, 0.0f);
    img.at(0, 0) = 1.0f; // top-left
    HeightParams p; p.base_thickness = 2.0; p.relief_scale = 3.0; p.interpolation = Interpolation::Nearest;
    HeightfieldSampler s(img, p);
    if (!near(s.sample(1.0, 0.375), 5.0)) return fail("cartesian top-left quadrant not high");
    if (!near(s.sample(1.0, 0.875), 2.0)) return fail("cartesian bottom-right quadrant not low");
    if (!near(s.sample(1.0, 0.125), 2.0)) return fail("cartesian top-right quadrant not low");
  }

  // Inverted relief: dark is high
  {
    ImageGrid img(8, 8, 0.25f);
    HeightParams p; p.base_thickness = 1.0; p.relief_scale = 4.0; p.invert = true;
    HeightfieldSampler s(img, p);
    if (!near(s.sample(0.5, 0.5), 4.0, 1e-6)) return fail("invert: expected 1 + 0.75 * 4");
  }

  // Plate lookup over the whole image
  {
    ImageGrid img(2, 1);
    img.at(0, 0) = 0.0f; img.at(1, 0) = 1.0f;
    HeightParams p; p.base_thickness = 1.0; p.relief_scale = 1.0; p.interpolation = Interpolation::Nearest;
    HeightfieldSampler s(img, p);
    if (!near(s.sample_xy(0.9, 0.5), 2.0)) return fail("sample_xy right half");
    if (!near(s.sample_xy(0.1, 0.5), 1.0)) return fail("sample_xy left half");
  }

  return 0;
}
