// Median-split BVH over mesh triangles; results match LinearIntersector exactly
#pragma once

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>
#include "core/types.hpp"
#include "render/Intersector.hpp"

namespace lamp::render {

inline double component(const lamp::Vec3& v, int axis) {
  return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

struct Aabb {
  lamp::Vec3 lo{ std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity() };
  lamp::Vec3 hi{ -std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity() };
  void expand(const lamp::Vec3& p) {
    lo.x = std::min(lo.x, p.x); lo.y = std::min(lo.y, p.y); lo.z = std::min(lo.z, p.z);
    hi.x = std::max(hi.x, p.x); hi.y = std::max(hi.y, p.y); hi.z = std::max(hi.z, p.z);
  }
  void expand(const Aabb& b) { expand(b.lo); expand(b.hi); }
  void pad(double e) { lo -= lamp::Vec3{e, e, e}; hi += lamp::Vec3{e, e, e}; }
  lamp::Vec3 extent() const { return {hi.x - lo.x, hi.y - lo.y, hi.z - lo.z}; }
  // Slab test over [0, t_max]. A NaN slab (zero direction on a box face) keeps the interval.
  bool intersect(const lamp::Vec3& ro, const lamp::Vec3& rd, double t_max) const {
    double t0 = 0.0, t1 = t_max;
    for (int axis = 0; axis < 3; ++axis) {
      const double inv_d = 1.0 / component(rd, axis);
      double t_near = (component(lo, axis) - component(ro, axis)) * inv_d;
      double t_far = (component(hi, axis) - component(ro, axis)) * inv_d;
      if (inv_d < 0.0) std::swap(t_near, t_far);
      t0 = std::max(t0, t_near);
      t1 = std::min(t1, t_far);
      if (t1 < t0) return false;
    }
    return true;
  }
};

struct BVHNode { Aabb box; int left{-1}, right{-1}; int start{0}, count{0}; bool leaf{false}; };

class BVHIntersector : public Intersector {
public:
  explicit BVHIntersector(std::vector<lamp::geom::Triangle> tris);
  Hit closest(const Ray& r) const override;
  bool any_hit(const Ray& r, double t_max, std::size_t* grazing = nullptr) const override;
  std::size_t size() const override { return m_tris.size(); }
  std::size_t node_count() const { return m_nodes.size(); }

private:
  std::vector<lamp::geom::Triangle> m_tris;
  std::vector<int> m_indices;
  std::vector<lamp::Vec3> m_centroids;
  std::vector<BVHNode> m_nodes;

  int build_node(int start, int count);
  static Aabb tri_bounds(const lamp::geom::Triangle& t);
  // Visits every leaf triangle whose box the ray reaches before *t_max;
  // fn may shrink *t_max and returns true to stop the traversal.
  template <class Fn> void traverse(const Ray& r, const double* t_max, Fn&& fn) const;
};

} // namespace lamp::render
