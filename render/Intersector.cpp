#include "render/Intersector.hpp"
#include "core/units.hpp"

#include <cmath>

namespace lamp::render {

using lamp::Vec3;
using lamp::geom::Triangle;

TriHit intersect_triangle(const Ray& r, const Triangle& tri, double& t) {
  Vec3 v0v1 = tri.v1 - tri.v0;
  Vec3 v0v2 = tri.v2 - tri.v0;
  Vec3 pvec = Vec3::cross(r.d, v0v2);
  double det = Vec3::dot(v0v1, pvec);
  if (std::abs(det) < lamp::units::det_eps) return TriHit::Parallel;
  double invDet = 1.0 / det;
  Vec3 tvec = r.o - tri.v0;
  double u = Vec3::dot(tvec, pvec) * invDet;
  if (u < 0.0 || u > 1.0) return TriHit::Miss;
  Vec3 qvec = Vec3::cross(tvec, v0v1);
  double v = Vec3::dot(r.d, qvec) * invDet;
  if (v < 0.0 || u + v > 1.0) return TriHit::Miss;
  double tparam = Vec3::dot(v0v2, qvec) * invDet;
  if (!(tparam > lamp::units::hit_eps)) return TriHit::Miss;
  t = tparam;
  return TriHit::Hit;
}

Hit LinearIntersector::closest(const Ray& r) const {
  Hit h;
  for (const auto& tri : m_tris) {
    double t = 0.0;
    TriHit k = intersect_triangle(r, tri, t);
    if (k == TriHit::Parallel) h.grazing++;
    else if (k == TriHit::Hit && t < h.t) h.t = t;
  }
  if (!std::isfinite(h.t)) return h;
  // first index within the tie window of the minimum
  const double t_tie = h.t + lamp::units::tie_eps;
  for (std::size_t i = 0; i < m_tris.size(); ++i) {
    double t = 0.0;
    if (intersect_triangle(r, m_tris[i], t) == TriHit::Hit && t <= t_tie) {
      h.tri = static_cast<int>(i); h.t = t;
      break;
    }
  }
  return h;
}

bool LinearIntersector::any_hit(const Ray& r, double t_max, std::size_t* grazing) const {
  for (const auto& tri : m_tris) {
    double t = 0.0;
    TriHit k = intersect_triangle(r, tri, t);
    if (k == TriHit::Parallel) { if (grazing) (*grazing)++; continue; }
    if (k == TriHit::Hit && t < t_max) return true;
  }
  return false;
}

} // namespace lamp::render
