// Shadow and angled-view passes over a triangle mesh lit by a point light
#pragma once

#include <cstddef>
#include <memory>
#include "core/types.hpp"
#include "geom/Mesh.hpp"
#include "image/ImageGrid.hpp"
#include "render/Intersector.hpp"

namespace lamp::render {

struct Light {
  lamp::Vec3 position{0,0,0};
  double intensity{1.0}; // shading = intensity * cos / d^2
};

// Horizontal receiving plane, square of side `size` centred at (cx, cy, z).
// Pixel row 0 lies at +Y.
struct ShadowPlane {
  double z{-100.0};
  double cx{0.0}, cy{0.0};
  double size{200.0};
};

enum class CameraProjection { Perspective, Orthographic };

struct Camera {
  lamp::Vec3 position{0, 0, 100};
  lamp::Vec3 target{0, 0, 0};
  lamp::Vec3 up{0, 0, 1};
  CameraProjection projection{CameraProjection::Perspective};
  double fov_deg{60.0};     // vertical field of view (perspective)
  double view_height{100.0}; // visible height [mm] (orthographic)
};

struct RenderOptions {
  bool use_bvh{true};
  double background{0.0};
  bool cast_shadows{false}; // view pass: darken points hidden from the light
};

struct RenderStats {
  std::size_t rays{0};
  std::size_t hits{0};
  std::size_t grazing{0};
  RenderStats& operator+=(const RenderStats& o) {
    rays += o.rays; hits += o.hits; grazing += o.grazing; return *this;
  }
};

// Throws lamp::ConfigurationError for an empty mesh.
std::unique_ptr<Intersector> make_intersector(const lamp::geom::Mesh& mesh, bool use_bvh);

// 1 = lit, 0 = a face blocks the segment from the light to the pixel centre.
lamp::image::ImageGrid render_shadow(const lamp::geom::Mesh& mesh, const Light& light,
                                     const ShadowPlane& plane, int width, int height,
                                     const RenderOptions& opts = {}, RenderStats* stats = nullptr);

// Lambert shading with inverse-square falloff, clamped to [0,1].
lamp::image::ImageGrid render_view(const lamp::geom::Mesh& mesh, const Light& light,
                                   const Camera& cam, int width, int height,
                                   const RenderOptions& opts = {}, RenderStats* stats = nullptr);

// Lower-level entry points for callers that reuse one intersector.
lamp::image::ImageGrid trace_shadow(const Intersector& isect, const Light& light,
                                    const ShadowPlane& plane, int width, int height,
                                    RenderStats* stats = nullptr);
lamp::image::ImageGrid trace_view(const Intersector& isect, const std::vector<lamp::Vec3>& normals,
                                  const Light& light, const Camera& cam, int width, int height,
                                  const RenderOptions& opts = {}, RenderStats* stats = nullptr);

} // namespace lamp::render
