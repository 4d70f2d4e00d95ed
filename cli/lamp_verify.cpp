#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "cli/Options.hpp"
#include "core/errors.hpp"
#include "geom/Mesh.hpp"
#include "geom/Topology.hpp"
#include "image/ImageIO.hpp"
#include "scene/Scene.hpp"

namespace {

const char* kUsage =
  "Usage: lamp_verify <mesh.stl> [--shadow_output shadow.png] [--render_output render.png]\n"
  "  [--config file.json] [--plane_distance mm] [--shadow_size mm] [--resolution px]\n"
  "  [--shadow_resolution px] [--render_resolution px] [--light_offset mm] [--light_intensity v]\n"
  "  [--camera_distance mm] [--camera_elevation_deg deg] [--camera_azimuth_deg deg] [--fov_deg deg]\n"
  "  [--orthographic] [--render_shadows] [--background v] [--linear] [--verbose]\n";

void print_stats(const char* name, const lamp::render::RenderStats& s) {
  std::cout << name << ": rays=" << s.rays << ", hits=" << s.hits << ", grazing=" << s.grazing << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string config_path;
  std::string shadow_output = "shadow.png";
  std::string render_output = "render.png";
  bool verbose = false;
  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if (a == "--help") { std::cout << kUsage; return 0; }
    if (a == "--verbose") { verbose = true; continue; }
    if (a == "--config" && i+1<argc) { config_path = argv[++i]; continue; }
    if (a == "--shadow_output" && i+1<argc) { shadow_output = argv[++i]; continue; }
    if (a == "--render_output" && i+1<argc) { render_output = argv[++i]; continue; }
    if (a.rfind("--", 0) != 0) { positional.push_back(a); continue; }
    std::string key = a.substr(2);
    if (lamp::cli::is_flag(key)) overrides.emplace_back(key, "true");
    else if (i+1<argc) overrides.emplace_back(key, argv[++i]);
    else { std::cerr << "Missing value for " << a << "\n" << kUsage; return 2; }
  }
  if (positional.size() != 1) { std::cerr << kUsage; return 2; }

  std::string err;
  auto mesh = lamp::geom::Mesh::load(positional[0], &err);
  if (!mesh) { std::cerr << "Failed to load mesh: " << err << "\n"; return 1; }

  auto rep = lamp::geom::check_topology(*mesh);
  if (!rep.watertight()) {
    std::cerr << "warning: mesh is not a closed manifold (open=" << rep.open_edges
              << ", nonmanifold=" << rep.nonmanifold_edges << ", misoriented=" << rep.misoriented_edges
              << ", degenerate=" << rep.degenerate_faces << ")\n";
  }

  lamp::scene::SceneConfig cfg;
  lamp::scene::SceneResult res;
  auto t0 = std::chrono::high_resolution_clock::now();
  try {
    if (!config_path.empty()) {
      auto text = lamp::cli::slurp(config_path, &err);
      if (!text) throw lamp::ConfigurationError(err);
      lamp::cli::apply_scene_file(*text, cfg);
    }
    for (const auto& kv : overrides) {
      if (!lamp::cli::set_scene_option(cfg, kv.first, kv.second))
        throw lamp::ConfigurationError("Unknown option --" + kv.first);
    }
    res = lamp::scene::verify(*mesh, cfg);
  } catch (const lamp::ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const lamp::GeometryError& e) {
    std::cerr << "Geometry error: " << e.what() << "\n";
    return 3;
  }
  auto t1 = std::chrono::high_resolution_clock::now();

  if (!lamp::image::save_image(shadow_output, res.shadow, &err)) { std::cerr << err << "\n"; return 1; }
  if (!lamp::image::save_image(render_output, res.render, &err)) { std::cerr << err << "\n"; return 1; }

  std::cout << "triangles=" << mesh->face_count() << "\n";
  std::cout << "light = [" << res.light.position.x << ", " << res.light.position.y << ", "
            << res.light.position.z << "], intensity=" << res.light.intensity << "\n";
  std::cout << "shadow plane z=" << res.plane.z << ", size=" << res.plane.size << "\n";
  std::cout << "Shadow saved to " << shadow_output << "\n";
  std::cout << "Render saved to " << render_output << "\n";
  if (verbose) {
    print_stats("shadow", res.shadow_stats);
    print_stats("render", res.render_stats);
    std::cout << "camera = [" << res.camera.position.x << ", " << res.camera.position.y << ", "
              << res.camera.position.z << "]\n";
    std::cout << "trace_ms=" << std::chrono::duration<double, std::milli>(t1-t0).count() << "\n";
  }
  return 0;
}
