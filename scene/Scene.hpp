// Wires generator and verifier: derives light, shadow plane and camera from the plate
#pragma once

#include <string>
#include "geom/DiskBuilder.hpp"
#include "geom/PlateBuilder.hpp"
#include "geom/HeightfieldSampler.hpp"
#include "geom/Mesh.hpp"
#include "image/ImageGrid.hpp"
#include "render/Tracer.hpp"

namespace lamp::scene {

enum class Shape { Disk, Plate };

struct GeneratorConfig {
  Shape shape{Shape::Disk};
  lamp::geom::DiskParams disk{};
  lamp::geom::PlateParams plate{};
  double base_thickness{1.0};
  double relief_scale{5.0};
  lamp::geom::Projection projection{lamp::geom::Projection::Cartesian};
  lamp::geom::Interpolation interpolation{lamp::geom::Interpolation::Bilinear};
  bool invert{false};
};

// Negative values select the derived default noted on each field.
struct SceneConfig {
  double plane_distance{100.0};      // below the lowest vertex [mm]
  double shadow_size{-1.0};          // default: 2.5 x projected outer radius
  int shadow_resolution{256};
  double light_offset{0.0};          // above the hole top [mm]; 0 puts the light at hole height
  double light_intensity{-1.0};      // default: squared distance light -> outer top edge
  double camera_distance{-1.0};      // default: 2.5 x outer radius
  double camera_elevation_deg{45.0};
  double camera_azimuth_deg{-90.0};
  double fov_deg{60.0};
  bool orthographic{false};
  int render_resolution{256};
  bool use_bvh{true};
  bool render_shadows{false};
  double background{0.0};
};

// Measurements taken from a plate mesh around its vertical axis.
struct PlateFrame {
  double cx{0.0}, cy{0.0};     // axis
  double hole_radius{0.0};     // smallest vertex distance from the axis
  double hole_top{0.0};        // highest vertex on the inner rim
  double outer_radius{0.0};    // largest vertex distance from the axis
  double min_z{0.0}, max_z{0.0};
};

struct SceneResult {
  lamp::image::ImageGrid shadow;
  lamp::image::ImageGrid render;
  lamp::render::Light light;
  lamp::render::ShadowPlane plane;
  lamp::render::Camera camera;
  lamp::render::RenderStats shadow_stats;
  lamp::render::RenderStats render_stats;
};

// Builds the sampler and dispatches to the disk or plate builder.
lamp::geom::Mesh generate(const lamp::image::ImageGrid& img, const GeneratorConfig& cfg);

// Throws lamp::GeometryError when every vertex lies at the same distance from the axis.
PlateFrame measure(const lamp::geom::Mesh& mesh);

lamp::render::Light place_light(const PlateFrame& f, const SceneConfig& cfg);
lamp::render::ShadowPlane place_plane(const PlateFrame& f, const lamp::render::Light& light, const SceneConfig& cfg);
lamp::render::Camera place_camera(const PlateFrame& f, const SceneConfig& cfg);

// Shadow and angled render of an existing mesh. Throws lamp::ConfigurationError
// for an empty mesh or invalid resolutions, lamp::GeometryError from measure().
SceneResult verify(const lamp::geom::Mesh& mesh, const SceneConfig& cfg);

} // namespace lamp::scene
