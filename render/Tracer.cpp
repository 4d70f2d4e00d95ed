#include "render/Tracer.hpp"
#include "render/BVH.hpp"
#include "core/errors.hpp"
#include "core/units.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lamp::render {

using lamp::Vec3;
using lamp::image::ImageGrid;

static void check_size(int width, int height) {
  if (width < 1 || height < 1)
    throw lamp::ConfigurationError("render size must be at least 1x1, got " +
                                   std::to_string(width) + "x" + std::to_string(height));
}

std::unique_ptr<Intersector> make_intersector(const lamp::geom::Mesh& mesh, bool use_bvh) {
  if (mesh.empty()) throw lamp::ConfigurationError("mesh has no triangles");
  if (use_bvh) return std::make_unique<BVHIntersector>(mesh.triangles());
  return std::make_unique<LinearIntersector>(mesh.triangles());
}

ImageGrid trace_shadow(const Intersector& isect, const Light& light, const ShadowPlane& plane,
                       int width, int height, RenderStats* stats) {
  check_size(width, height);
  if (!(plane.size > 0.0)) throw lamp::ConfigurationError("shadow plane size must be > 0");

  ImageGrid img(width, height, 1.0f);
  std::size_t rays = 0, grazing = 0;
  const double px_size = plane.size / width;
  const double py_size = plane.size / height;

#if defined(LAMP_USE_OPENMP)
  #pragma omp parallel for schedule(dynamic) reduction(+:rays,grazing)
#endif
  for (long long iy = 0; iy < height; ++iy) {
    const double y = plane.cy + 0.5 * plane.size - (iy + 0.5) * py_size;
    for (int ix = 0; ix < width; ++ix) {
      const double x = plane.cx - 0.5 * plane.size + (ix + 0.5) * px_size;
      Vec3 to = Vec3{x, y, plane.z} - light.position;
      const double dist = to.norm();
      if (dist <= 0.0) continue;
      Ray ray{light.position, to / dist};
      rays++;
      if (isect.any_hit(ray, dist - lamp::units::hit_eps, &grazing))
        img.at(ix, static_cast<int>(iy)) = 0.0f;
    }
  }

  if (stats) {
    std::size_t dark = static_cast<std::size_t>(std::count(img.pixels.begin(), img.pixels.end(), 0.0f));
    *stats += RenderStats{rays, dark, grazing};
  }
  return img;
}

ImageGrid render_shadow(const lamp::geom::Mesh& mesh, const Light& light, const ShadowPlane& plane,
                        int width, int height, const RenderOptions& opts, RenderStats* stats) {
  check_size(width, height);
  auto isect = make_intersector(mesh, opts.use_bvh);
  return trace_shadow(*isect, light, plane, width, height, stats);
}

namespace {

struct CameraBasis { Vec3 forward, right, up; };

CameraBasis make_basis(const Camera& cam) {
  if (cam.projection == CameraProjection::Perspective && !(cam.fov_deg > 0.0 && cam.fov_deg < 180.0))
    throw lamp::ConfigurationError("fov_deg must lie in (0,180), got " + std::to_string(cam.fov_deg));
  if (cam.projection == CameraProjection::Orthographic && !(cam.view_height > 0.0))
    throw lamp::ConfigurationError("view_height must be > 0, got " + std::to_string(cam.view_height));
  Vec3 forward = (cam.target - cam.position).normalized();
  if (forward.norm2() == 0.0) throw lamp::ConfigurationError("camera position equals its target");
  Vec3 right = Vec3::cross(forward, cam.up);
  if (right.norm() < 1e-9) {
    // looking along `up`; pick any perpendicular reference
    right = Vec3::cross(forward, std::abs(forward.y) < 0.9 ? Vec3{0,1,0} : Vec3{1,0,0});
  }
  right = right.normalized();
  return {forward, right, Vec3::cross(right, forward)};
}

} // namespace

ImageGrid trace_view(const Intersector& isect, const std::vector<Vec3>& normals,
                     const Light& light, const Camera& cam, int width, int height,
                     const RenderOptions& opts, RenderStats* stats) {
  check_size(width, height);
  const CameraBasis b = make_basis(cam);
  const double aspect = static_cast<double>(width) / height;
  const double screen_dist = 1.0 / std::tan(0.5 * lamp::units::deg2rad(cam.fov_deg));
  const double half_h = 0.5 * cam.view_height;

  ImageGrid img(width, height, static_cast<float>(opts.background));
  std::size_t rays = 0, hits = 0, grazing = 0;

#if defined(LAMP_USE_OPENMP)
  #pragma omp parallel for schedule(dynamic) reduction(+:rays,hits,grazing)
#endif
  for (long long iy = 0; iy < height; ++iy) {
    const double py = 1.0 - 2.0 * (iy + 0.5) / height;
    for (int ix = 0; ix < width; ++ix) {
      const double px = (2.0 * (ix + 0.5) / width - 1.0) * aspect;
      Ray ray;
      if (cam.projection == CameraProjection::Perspective) {
        ray.o = cam.position;
        ray.d = (b.forward * screen_dist + b.right * px + b.up * py).normalized();
      } else {
        ray.o = cam.position + b.right * (px * half_h) + b.up * (py * half_h);
        ray.d = b.forward;
      }
      rays++;
      Hit h = isect.closest(ray);
      grazing += h.grazing;
      if (!h.hit()) continue;
      hits++;

      const Vec3 p = ray.o + ray.d * h.t;
      const Vec3& n = normals[static_cast<std::size_t>(h.tri)];
      Vec3 to_light = light.position - p;
      const double d2 = to_light.norm2();
      if (d2 <= 0.0) { img.at(ix, static_cast<int>(iy)) = 1.0f; continue; }
      const double d = std::sqrt(d2);
      to_light /= d;
      double lambert = std::max(0.0, Vec3::dot(n, to_light));
      if (lambert > 0.0 && opts.cast_shadows) {
        Ray sray{p + n * (10.0 * lamp::units::hit_eps), to_light};
        if (isect.any_hit(sray, d, &grazing)) lambert = 0.0;
      }
      const double value = light.intensity * lambert / d2;
      img.at(ix, static_cast<int>(iy)) = static_cast<float>(std::max(0.0, std::min(1.0, value)));
    }
  }

  if (stats) *stats += RenderStats{rays, hits, grazing};
  return img;
}

ImageGrid render_view(const lamp::geom::Mesh& mesh, const Light& light, const Camera& cam,
                      int width, int height, const RenderOptions& opts, RenderStats* stats) {
  check_size(width, height);
  auto isect = make_intersector(mesh, opts.use_bvh);
  std::vector<Vec3> normals(mesh.face_count());
  for (std::size_t i = 0; i < normals.size(); ++i) normals[i] = mesh.normal(i);
  return trace_view(*isect, normals, light, cam, width, height, opts, stats);
}

} // namespace lamp::render
