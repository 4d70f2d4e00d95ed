#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "cli/Options.hpp"
#include "core/errors.hpp"
#include "geom/Topology.hpp"
#include "image/ImageIO.hpp"
#include "scene/Scene.hpp"

namespace {

const char* kUsage =
  "Usage: lamp_generate <image.png|pgm|ppm> <out.stl> [--config file.json]\n"
  "  [--shape disk|plate] [--outer_radius mm] [--hole_radius mm]\n"
  "  [--radial_segments n] [--angular_segments n] [--base_thickness mm] [--relief_scale mm]\n"
  "  [--projection cartesian|polar] [--interpolation bilinear|nearest] [--invert]\n"
  "  [--plate_width mm] [--plate_depth mm] [--plate_columns n] [--plate_rows n] [--verbose]\n";

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string config_path;
  bool verbose = false;
  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if (a == "--help") { std::cout << kUsage; return 0; }
    if (a == "--verbose") { verbose = true; continue; }
    if (a == "--config" && i+1<argc) { config_path = argv[++i]; continue; }
    if (a.rfind("--", 0) != 0) { positional.push_back(a); continue; }
    std::string key = a.substr(2);
    if (lamp::cli::is_flag(key)) overrides.emplace_back(key, "true");
    else if (i+1<argc) overrides.emplace_back(key, argv[++i]);
    else { std::cerr << "Missing value for " << a << "\n" << kUsage; return 2; }
  }
  if (positional.size() != 2) { std::cerr << kUsage; return 2; }
  const std::string& image_path = positional[0];
  const std::string& out_path = positional[1];

  lamp::scene::GeneratorConfig cfg;
  lamp::geom::Mesh mesh;
  auto t0 = std::chrono::high_resolution_clock::now();
  try {
    if (!config_path.empty()) {
      std::string err;
      auto text = lamp::cli::slurp(config_path, &err);
      if (!text) throw lamp::ConfigurationError(err);
      lamp::cli::apply_generator_file(*text, cfg);
    }
    for (const auto& kv : overrides) {
      if (!lamp::cli::set_generator_option(cfg, kv.first, kv.second))
        throw lamp::ConfigurationError("Unknown option --" + kv.first);
    }

    std::string err;
    auto img = lamp::image::load_image(image_path, &err);
    if (!img) { std::cerr << "Failed to load image: " << err << "\n"; return 1; }
    if (verbose) std::cout << "image " << img->width << "x" << img->height << "\n";

    mesh = lamp::scene::generate(*img, cfg);
  } catch (const lamp::ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const lamp::GeometryError& e) {
    std::cerr << "Geometry error: " << e.what() << "\n";
    return 3;
  }
  auto t1 = std::chrono::high_resolution_clock::now();

  std::string err;
  if (!mesh.saveSTL(out_path, &err)) { std::cerr << "Failed to write mesh: " << err << "\n"; return 1; }

  std::cout << "STL saved to " << out_path << " (" << mesh.face_count() << " triangles, "
            << mesh.vertex_count() << " vertices)\n";
  if (verbose) {
    auto rep = lamp::geom::check_topology(mesh);
    auto b = mesh.bounds();
    std::cout << "edges=" << rep.edges << ", open=" << rep.open_edges << ", nonmanifold=" << rep.nonmanifold_edges
              << ", misoriented=" << rep.misoriented_edges << ", degenerate=" << rep.degenerate_faces << "\n";
    std::cout << "volume_mm3=" << lamp::geom::signed_volume(mesh) << "\n";
    std::cout << "z[min,max]=" << b.lo.z << ", " << b.hi.z << "\n";
    std::cout << "build_ms=" << std::chrono::duration<double, std::milli>(t1-t0).count() << "\n";
  }
  return 0;
}
