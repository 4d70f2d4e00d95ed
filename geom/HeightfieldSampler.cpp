#include "geom/HeightfieldSampler.hpp"
#include "core/errors.hpp"
#include "core/units.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lamp::geom {

static inline int clamp_index(int i, int n) { return std::max(0, std::min(n - 1, i)); }

static inline int wrap_index(int i, int n) {
  int r = i % n;
  return r < 0 ? r + n : r;
}

HeightfieldSampler::HeightfieldSampler(const lamp::image::ImageGrid& img, const HeightParams& p)
  : m_img(img), m_p(p) {
  if (img.empty())
    throw lamp::ConfigurationError("Image has zero width or height (" + std::to_string(img.width) +
                                   "x" + std::to_string(img.height) + ")");
  if (!(p.base_thickness > 0.0))
    throw lamp::ConfigurationError("base_thickness must be > 0, got " + std::to_string(p.base_thickness));
  if (!(p.relief_scale >= 0.0))
    throw lamp::ConfigurationError("relief_scale must be >= 0, got " + std::to_string(p.relief_scale));
  if (!(p.hole_fraction >= 0.0 && p.hole_fraction < 1.0))
    throw lamp::ConfigurationError("hole fraction must lie in [0,1), got " + std::to_string(p.hole_fraction));
}

double HeightfieldSampler::lookup(double px, double py, bool wrap_x) const {
  const int W = m_img.width, H = m_img.height;
  auto col = [&](int i) { return wrap_x ? wrap_index(i, W) : clamp_index(i, W); };

  if (m_p.interpolation == Interpolation::Nearest) {
    int ix = col(static_cast<int>(std::floor(px)));
    int iy = clamp_index(static_cast<int>(std::floor(py)), H);
    return m_img.at(ix, iy);
  }

  double fx = px - 0.5, fy = py - 0.5;
  double x0f = std::floor(fx), y0f = std::floor(fy);
  double tx = fx - x0f, ty = fy - y0f;
  int x0 = static_cast<int>(x0f), y0 = static_cast<int>(y0f);
  int xa = col(x0), xb = col(x0 + 1);
  int ya = clamp_index(y0, H), yb = clamp_index(y0 + 1, H);
  double top = m_img.at(xa, ya) * (1.0 - tx) + m_img.at(xb, ya) * tx;
  double bot = m_img.at(xa, yb) * (1.0 - tx) + m_img.at(xb, yb) * tx;
  return top * (1.0 - ty) + bot * ty;
}

double HeightfieldSampler::luminance(double u, double v) const {
  u = std::max(0.0, std::min(1.0, u));
  const double W = m_img.width, H = m_img.height;
  double lum = 0.0;
  if (m_p.projection == Projection::Polar) {
    lum = lookup(v * W, u * H, true);
  } else {
    const double h = m_p.hole_fraction;
    const double rho = h + u * (1.0 - h);
    const double th = 2.0 * lamp::units::pi * v;
    const double x = rho * std::cos(th), y = rho * std::sin(th);
    lum = lookup((x + 1.0) * 0.5 * W, (1.0 - y) * 0.5 * H, false);
  }
  return std::max(0.0, std::min(1.0, lum));
}

double HeightfieldSampler::to_height(double lum) const {
  if (m_p.invert) lum = 1.0 - lum;
  return m_p.base_thickness + lum * m_p.relief_scale;
}

double HeightfieldSampler::sample(double u, double v) const {
  return to_height(luminance(u, v));
}

double HeightfieldSampler::sample_xy(double x, double y) const {
  double lum = lookup(x * m_img.width, (1.0 - y) * m_img.height, false);
  return to_height(std::max(0.0, std::min(1.0, lum)));
}

} // namespace lamp::geom
