// Ray/mesh queries. The linear scan is the reference; the BVH must agree with it.
#pragma once

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>
#include "core/types.hpp"
#include "geom/Mesh.hpp"

namespace lamp::render {

struct Ray { lamp::Vec3 o, d; }; // origin, direction (normalized)

struct Hit {
  double t{std::numeric_limits<double>::infinity()};
  int tri{-1};              // face index, -1 when nothing was hit
  std::size_t grazing{0};   // parallel ray/triangle pairs rejected during the query
  bool hit() const { return tri >= 0; }
};

enum class TriHit { Hit, Miss, Parallel };

// Möller-Trumbore. Edges are inclusive; t must exceed units::hit_eps.
TriHit intersect_triangle(const Ray& r, const lamp::geom::Triangle& tri, double& t);

class Intersector {
public:
  virtual ~Intersector() = default;
  // Nearest hit. Among hits within units::tie_eps of the minimum, the
  // smallest face index wins, independent of traversal order.
  virtual Hit closest(const Ray& r) const = 0;
  // True if some face is hit with t < t_max.
  virtual bool any_hit(const Ray& r, double t_max, std::size_t* grazing = nullptr) const = 0;
  virtual std::size_t size() const = 0;
};

class LinearIntersector : public Intersector {
public:
  explicit LinearIntersector(std::vector<lamp::geom::Triangle> tris) : m_tris(std::move(tris)) {}
  Hit closest(const Ray& r) const override;
  bool any_hit(const Ray& r, double t_max, std::size_t* grazing = nullptr) const override;
  std::size_t size() const override { return m_tris.size(); }

private:
  std::vector<lamp::geom::Triangle> m_tris;
};

} // namespace lamp::render
