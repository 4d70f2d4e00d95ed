#include "scene/Scene.hpp"
#include "core/errors.hpp"
#include "core/units.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>

namespace lamp::scene {

using lamp::Vec3;

lamp::geom::Mesh generate(const lamp::image::ImageGrid& img, const GeneratorConfig& cfg) {
  lamp::geom::HeightParams hp;
  hp.base_thickness = cfg.base_thickness;
  hp.relief_scale = cfg.relief_scale;
  hp.projection = cfg.projection;
  hp.interpolation = cfg.interpolation;
  hp.invert = cfg.invert;

  if (cfg.shape == Shape::Plate) {
    lamp::geom::HeightfieldSampler sampler(img, hp);
    return lamp::geom::build_plate(cfg.plate, sampler);
  }
  lamp::geom::validate(cfg.disk);
  hp.hole_fraction = cfg.disk.hole_radius / cfg.disk.outer_radius;
  lamp::geom::HeightfieldSampler sampler(img, hp);
  return lamp::geom::build_disk(cfg.disk, sampler);
}

PlateFrame measure(const lamp::geom::Mesh& mesh) {
  if (mesh.vertex_count() == 0) throw lamp::ConfigurationError("mesh has no vertices");
  PlateFrame f;
  const lamp::Bounds b = mesh.bounds();
  f.cx = 0.5 * (b.lo.x + b.hi.x);
  f.cy = 0.5 * (b.lo.y + b.hi.y);
  f.min_z = b.lo.z;
  f.max_z = b.hi.z;

  auto radial = [&](const Vec3& v) { return std::hypot(v.x - f.cx, v.y - f.cy); };
  f.hole_radius = 1e300;
  for (const auto& v : mesh.vertices()) {
    double r = radial(v);
    f.hole_radius = std::min(f.hole_radius, r);
    f.outer_radius = std::max(f.outer_radius, r);
  }
  if (!(f.outer_radius > f.hole_radius))
    throw lamp::GeometryError("mesh has no radial extent around its axis (outer radius " +
                              std::to_string(f.outer_radius) + ")");
  // STL coordinates are float32, so the inner ring is only equal to ~1e-6 relative
  const double tol = 1e-5 * std::max(1.0, f.outer_radius);
  f.hole_top = f.min_z;
  for (const auto& v : mesh.vertices()) {
    if (radial(v) <= f.hole_radius + tol) f.hole_top = std::max(f.hole_top, v.z);
  }
  return f;
}

lamp::render::Light place_light(const PlateFrame& f, const SceneConfig& cfg) {
  lamp::render::Light light;
  light.position = {f.cx, f.cy, f.hole_top + cfg.light_offset};
  if (cfg.light_intensity >= 0.0) {
    light.intensity = cfg.light_intensity;
  } else {
    const double dz = light.position.z - f.max_z;
    const double d2 = f.outer_radius * f.outer_radius + dz * dz;
    light.intensity = (d2 > 0.0) ? d2 : 1.0;
  }
  return light;
}

lamp::render::ShadowPlane place_plane(const PlateFrame& f, const lamp::render::Light& light,
                                      const SceneConfig& cfg) {
  if (!(cfg.plane_distance > 0.0))
    throw lamp::ConfigurationError("plane_distance must be > 0, got " + std::to_string(cfg.plane_distance));
  lamp::render::ShadowPlane plane;
  plane.cx = f.cx;
  plane.cy = f.cy;
  plane.z = f.min_z - cfg.plane_distance;
  if (cfg.shadow_size > 0.0) {
    plane.size = cfg.shadow_size;
    return plane;
  }
  // Projection of the outer edge from the light, taken at the bottom and at the top.
  const double L = light.position.z;
  double projected = 0.0;
  for (double z_edge : {f.min_z, f.max_z}) {
    if (L - z_edge > 0.0) projected = std::max(projected, f.outer_radius * (L - plane.z) / (L - z_edge));
  }
  if (projected <= 0.0) projected = 2.0 * f.outer_radius;
  plane.size = 2.5 * projected;
  return plane;
}

lamp::render::Camera place_camera(const PlateFrame& f, const SceneConfig& cfg) {
  lamp::render::Camera cam;
  const double dist = (cfg.camera_distance > 0.0) ? cfg.camera_distance : 2.5 * f.outer_radius;
  const double el = lamp::units::deg2rad(cfg.camera_elevation_deg);
  const double az = lamp::units::deg2rad(cfg.camera_azimuth_deg);
  cam.target = {f.cx, f.cy, 0.5 * (f.min_z + f.max_z)};
  cam.position = cam.target + Vec3{std::cos(el) * std::cos(az), std::cos(el) * std::sin(az), std::sin(el)} * dist;
  cam.up = {0, 0, 1};
  cam.fov_deg = cfg.fov_deg;
  cam.projection = cfg.orthographic ? lamp::render::CameraProjection::Orthographic
                                    : lamp::render::CameraProjection::Perspective;
  cam.view_height = 2.4 * f.outer_radius;
  return cam;
}

SceneResult verify(const lamp::geom::Mesh& mesh, const SceneConfig& cfg) {
  if (cfg.shadow_resolution < 1 || cfg.render_resolution < 1)
    throw lamp::ConfigurationError("resolutions must be >= 1");
  if (!(cfg.fov_deg > 0.0 && cfg.fov_deg < 180.0))
    throw lamp::ConfigurationError("fov_deg must lie in (0,180), got " + std::to_string(cfg.fov_deg));

  auto isect = lamp::render::make_intersector(mesh, cfg.use_bvh);
  const PlateFrame frame = measure(mesh);

  SceneResult res;
  res.light = place_light(frame, cfg);
  res.plane = place_plane(frame, res.light, cfg);
  res.camera = place_camera(frame, cfg);

  res.shadow = lamp::render::trace_shadow(*isect, res.light, res.plane,
                                          cfg.shadow_resolution, cfg.shadow_resolution, &res.shadow_stats);

  std::vector<Vec3> normals(mesh.face_count());
  for (std::size_t i = 0; i < normals.size(); ++i) normals[i] = mesh.normal(i);
  lamp::render::RenderOptions opts;
  opts.use_bvh = cfg.use_bvh;
  opts.background = cfg.background;
  opts.cast_shadows = cfg.render_shadows;
  res.render = lamp::render::trace_view(*isect, normals, res.light, res.camera,
                                        cfg.render_resolution, cfg.render_resolution, opts, &res.render_stats);
  return res;
}

} // namespace lamp::scene
