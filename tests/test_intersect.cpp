#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "geom/DiskBuilder.hpp"
#include "image/ImageGrid.hpp"
#include "render/BVH.hpp"
#include "render/Intersector.hpp"

using lamp::Vec3;
using lamp::geom::Triangle;
using lamp::render::BVHIntersector;
using lamp::render::LinearIntersector;
using lamp::render::Ray;
using lamp::render::TriHit;

static int fail(const std::string& msg) { std::cerr << msg << "\n"; return 1; }

int main() {
  const Triangle floor{Vec3{0,0,0}, Vec3{1,0,0}, Vec3{0,1,0}};

  // Straight down onto the triangle
  {
    double t = 0.0;
    if (lamp::render::intersect_triangle({Vec3{0.2,0.2,1.0}, Vec3{0,0,-1}}, floor, t) != TriHit::Hit || std::abs(t - 1.0) > 1e-12)
      return fail("downward ray missed or wrong distance");
    if (lamp::render::intersect_triangle({Vec3{0.2,0.2,-1.0}, Vec3{0,0,-1}}, floor, t) != TriHit::Miss)
      return fail("hit behind the origin");
    if (lamp::render::intersect_triangle({Vec3{0.9,0.9,1.0}, Vec3{0,0,-1}}, floor, t) != TriHit::Miss)
      return fail("hit outside the triangle");
  }

  // Parallel rays are a non-hit, never a fault
  {
    double t = 0.0;
    Ray grazing{Vec3{-1.0, 0.2, 0.0}, Vec3{1,0,0}};
    if (lamp::render::intersect_triangle(grazing, floor, t) != TriHit::Parallel) return fail("parallel ray not flagged");
    LinearIntersector lin({floor});
    auto h = lin.closest(grazing);
    if (h.hit() || h.grazing != 1) return fail("parallel ray produced a hit or was not counted");
    if (lin.any_hit(grazing, 1e9)) return fail("parallel ray reported as blocking");
  }

  // Equal distances resolve to the smallest face index
  {
    const Triangle far{Vec3{-5,-5,-3}, Vec3{5,-5,-3}, Vec3{0,5,-3}};
    std::vector<Triangle> tris = {far, far, floor, far, floor};
    Ray down{Vec3{0.1,0.1,2.0}, Vec3{0,0,-1}};
    LinearIntersector lin(tris);
    BVHIntersector bvh(tris);
    auto a = lin.closest(down), b = bvh.closest(down);
    if (a.tri != 2 || b.tri != 2) return fail("tie not resolved to index 2: linear=" + std::to_string(a.tri) +
                                              " bvh=" + std::to_string(b.tri));
    // a ray through the shared diagonal of a quad touches both halves
    std::vector<Triangle> quad = {
      {Vec3{1,0,0}, Vec3{1,1,0}, Vec3{0,1,0}},
      {Vec3{0,0,0}, Vec3{1,0,0}, Vec3{0,1,0}},
    };
    Ray diag{Vec3{0.5,0.5,1.0}, Vec3{0,0,-1}};
    if (LinearIntersector(quad).closest(diag).tri != 0 || BVHIntersector(quad).closest(diag).tri != 0)
      return fail("shared-edge hit not resolved to the smaller index");
  }

  // Same ray, same mesh, same answer
  {
    lamp::image::ImageGrid img(16, 16, 0.7f);
    lamp::geom::HeightParams hp; hp.hole_fraction = 0.25;
    lamp::geom::HeightfieldSampler s(img, hp);
    auto mesh = lamp::geom::build_disk({40.0, 10.0, 6, 48}, s);
    LinearIntersector lin(mesh.triangles());
    BVHIntersector bvh(mesh.triangles());
    if (bvh.size() != mesh.face_count() || bvh.node_count() == 0) return fail("BVH not built over every face");

    std::mt19937 rng(42);
    std::uniform_real_distribution<double> pos(-60.0, 60.0), dir(-1.0, 1.0);
    int hits = 0;
    for (int i = 0; i < 2000; ++i) {
      Vec3 o{pos(rng), pos(rng), 30.0 + 0.25 * pos(rng)};
      Vec3 target{0.5 * pos(rng), 0.5 * pos(rng), 3.0 * dir(rng)};
      Ray r{o, (target - o).normalized()};
      auto a1 = lin.closest(r), a2 = lin.closest(r), b = bvh.closest(r);
      if (a1.tri != a2.tri || a1.t != a2.t) return fail("repeat query differs");
      if (a1.tri != b.tri || a1.t != b.t) return fail("BVH disagrees with linear scan on ray " + std::to_string(i));
      double tmax = (target - o).norm();
      if (lin.any_hit(r, tmax) != bvh.any_hit(r, tmax)) return fail("any_hit disagrees on ray " + std::to_string(i));
      if (a1.hit()) hits++;
    }
    if (hits < 200) return fail("too few hits to be meaningful: " + std::to_string(hits));
  }

  return 0;
}
