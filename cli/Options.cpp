#include "cli/Options.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace lamp::cli {

using lamp::ConfigurationError;
using lamp::scene::GeneratorConfig;
using lamp::scene::SceneConfig;

std::optional<std::string> slurp(const std::string& path, std::string* err) {
  std::ifstream in(path);
  if (!in) { if (err) *err = "Failed to open config: " + path + ": " + std::strerror(errno); return std::nullopt; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
  return s.substr(b, e - b);
}

bool find_value(const std::string& s, const std::string& key, std::string& out) {
  auto pos = s.find("\"" + key + "\""); if (pos == std::string::npos) return false;
  pos = s.find(':', pos); if (pos == std::string::npos) return false;
  pos = s.find_first_not_of(" \t\r\n", pos+1); if (pos == std::string::npos) return false;
  if (s[pos] == '"') {
    auto end = s.find('"', pos+1); if (end == std::string::npos) return false;
    out = s.substr(pos+1, end-pos-1); return true;
  }
  auto end = s.find_first_of(",}\n\r", pos);
  out = trim(s.substr(pos, end == std::string::npos ? std::string::npos : end-pos));
  return !out.empty();
}

double parse_double(const std::string& s, const std::string& what) {
  const char* begin = s.c_str();
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE)
    throw ConfigurationError("Invalid number for " + what + ": '" + s + "'");
  return v;
}

int parse_int(const std::string& s, const std::string& what) {
  const char* begin = s.c_str();
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE || v < -2147483647L || v > 2147483647L)
    throw ConfigurationError("Invalid integer for " + what + ": '" + s + "'");
  return static_cast<int>(v);
}

bool parse_bool(const std::string& s, const std::string& what) {
  if (s == "true" || s == "1" || s == "on") return true;
  if (s == "false" || s == "0" || s == "off") return false;
  throw ConfigurationError("Invalid boolean for " + what + ": '" + s + "'");
}

bool is_flag(const std::string& key) {
  return key == "invert" || key == "orthographic" || key == "render_shadows" || key == "linear";
}

bool set_generator_option(GeneratorConfig& c, const std::string& key, const std::string& v) {
  if (key == "outer_radius") c.disk.outer_radius = parse_double(v, key);
  else if (key == "hole_radius") c.disk.hole_radius = parse_double(v, key);
  else if (key == "radial_segments") c.disk.radial_segments = parse_int(v, key);
  else if (key == "angular_segments") c.disk.angular_segments = parse_int(v, key);
  else if (key == "base_thickness") c.base_thickness = parse_double(v, key);
  else if (key == "relief_scale") c.relief_scale = parse_double(v, key);
  else if (key == "invert") c.invert = parse_bool(v, key);
  else if (key == "plate_width") c.plate.width = parse_double(v, key);
  else if (key == "plate_depth") c.plate.depth = parse_double(v, key);
  else if (key == "plate_columns") c.plate.columns = parse_int(v, key);
  else if (key == "plate_rows") c.plate.rows = parse_int(v, key);
  else if (key == "projection") {
    if (v == "cartesian") c.projection = lamp::geom::Projection::Cartesian;
    else if (v == "polar") c.projection = lamp::geom::Projection::Polar;
    else throw ConfigurationError("Unknown projection '" + v + "' (cartesian|polar)");
  } else if (key == "interpolation") {
    if (v == "bilinear") c.interpolation = lamp::geom::Interpolation::Bilinear;
    else if (v == "nearest") c.interpolation = lamp::geom::Interpolation::Nearest;
    else throw ConfigurationError("Unknown interpolation '" + v + "' (bilinear|nearest)");
  } else if (key == "shape") {
    if (v == "disk") c.shape = lamp::scene::Shape::Disk;
    else if (v == "plate") c.shape = lamp::scene::Shape::Plate;
    else throw ConfigurationError("Unknown shape '" + v + "' (disk|plate)");
  } else {
    return false;
  }
  return true;
}

bool set_scene_option(SceneConfig& c, const std::string& key, const std::string& v) {
  if (key == "plane_distance") c.plane_distance = parse_double(v, key);
  else if (key == "shadow_size") c.shadow_size = parse_double(v, key);
  else if (key == "resolution") c.shadow_resolution = c.render_resolution = parse_int(v, key);
  else if (key == "shadow_resolution") c.shadow_resolution = parse_int(v, key);
  else if (key == "render_resolution") c.render_resolution = parse_int(v, key);
  else if (key == "light_offset") c.light_offset = parse_double(v, key);
  else if (key == "light_intensity") c.light_intensity = parse_double(v, key);
  else if (key == "camera_distance") c.camera_distance = parse_double(v, key);
  else if (key == "camera_elevation_deg") c.camera_elevation_deg = parse_double(v, key);
  else if (key == "camera_azimuth_deg") c.camera_azimuth_deg = parse_double(v, key);
  else if (key == "fov_deg") c.fov_deg = parse_double(v, key);
  else if (key == "background") c.background = parse_double(v, key);
  else if (key == "orthographic") c.orthographic = parse_bool(v, key);
  else if (key == "render_shadows") c.render_shadows = parse_bool(v, key);
  else if (key == "linear") c.use_bvh = !parse_bool(v, key);
  else return false;
  return true;
}

const std::vector<std::string>& generator_keys() {
  static const std::vector<std::string> keys = {
    "shape", "outer_radius", "hole_radius", "radial_segments", "angular_segments",
    "base_thickness", "relief_scale", "projection", "interpolation", "invert",
    "plate_width", "plate_depth", "plate_columns", "plate_rows"
  };
  return keys;
}

const std::vector<std::string>& scene_keys() {
  // "resolution" first so the specific keys override it
  static const std::vector<std::string> keys = {
    "resolution", "shadow_resolution", "render_resolution", "plane_distance", "shadow_size",
    "light_offset", "light_intensity", "camera_distance", "camera_elevation_deg",
    "camera_azimuth_deg", "fov_deg", "background", "orthographic", "render_shadows", "linear"
  };
  return keys;
}

void apply_generator_file(const std::string& json, GeneratorConfig& cfg) {
  for (const auto& key : generator_keys()) {
    std::string v; if (find_value(json, key, v)) set_generator_option(cfg, key, v);
  }
}

void apply_scene_file(const std::string& json, SceneConfig& cfg) {
  for (const auto& key : scene_keys()) {
    std::string v; if (find_value(json, key, v)) set_scene_option(cfg, key, v);
  }
}

} // namespace lamp::cli
