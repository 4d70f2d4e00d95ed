// Maps polar samples of the annulus to relief heights read from an image
#pragma once

#include "image/ImageGrid.hpp"

namespace lamp::geom {

// How the annulus is laid over the picture.
//  Cartesian: the image square is inscribed in the disk's bounding square, so
//             the relief reads like the picture seen from above.
//  Polar:     equirectangular unwrap; rows run from the hole (top row) to the
//             rim (bottom row), columns run counter-clockwise from +X and wrap.
enum class Projection { Cartesian, Polar };

enum class Interpolation { Bilinear, Nearest };

struct HeightParams {
  double base_thickness{1.0};   // [mm], must be > 0
  double relief_scale{5.0};     // [mm] added at luminance 1
  double hole_fraction{0.0};    // hole_radius / outer_radius, in [0,1)
  Projection projection{Projection::Cartesian};
  Interpolation interpolation{Interpolation::Bilinear};
  bool invert{false};           // dark pixels become high
};

class HeightfieldSampler {
public:
  // Keeps a reference to img; it must outlive the sampler.
  // Throws lamp::ConfigurationError on an empty image or invalid params.
  HeightfieldSampler(const lamp::image::ImageGrid& img, const HeightParams& p);

  // u: radial fraction (0 = hole edge, 1 = outer edge), v: angular fraction in [0,1)
  double sample(double u, double v) const;

  // x, y in [0,1] across the whole image, y = 0 at the bottom edge.
  double sample_xy(double x, double y) const;

  double luminance(double u, double v) const;
  const HeightParams& params() const { return m_p; }
  double min_height() const { return m_p.base_thickness; }
  double max_height() const { return m_p.base_thickness + m_p.relief_scale; }

private:
  const lamp::image::ImageGrid& m_img;
  HeightParams m_p;

  // px, py in continuous pixel units (pixel centres at integer + 0.5)
  double lookup(double px, double py, bool wrap_x) const;
  double to_height(double lum) const;
};

} // namespace lamp::geom
