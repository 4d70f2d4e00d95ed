// Option handling shared by the command-line tools: flat JSON config files and --key value pairs
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "scene/Scene.hpp"

namespace lamp::cli {

std::optional<std::string> slurp(const std::string& path, std::string* err = nullptr);

// Raw value of a top-level "key": string quotes removed, numbers/booleans as written.
bool find_value(const std::string& json, const std::string& key, std::string& out);

// Throw lamp::ConfigurationError naming `what` when s is not a complete number.
double parse_double(const std::string& s, const std::string& what);
int parse_int(const std::string& s, const std::string& what);
bool parse_bool(const std::string& s, const std::string& what);

// Options that take no value on the command line.
bool is_flag(const std::string& key);

// Return false for an unknown key; throw lamp::ConfigurationError for a bad value.
bool set_generator_option(lamp::scene::GeneratorConfig& cfg, const std::string& key, const std::string& value);
bool set_scene_option(lamp::scene::SceneConfig& cfg, const std::string& key, const std::string& value);

const std::vector<std::string>& generator_keys();
const std::vector<std::string>& scene_keys();

// Apply every known key found in a config file's text.
void apply_generator_file(const std::string& json, lamp::scene::GeneratorConfig& cfg);
void apply_scene_file(const std::string& json, lamp::scene::SceneConfig& cfg);

} // namespace lamp::cli
