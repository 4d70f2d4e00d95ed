// Error kinds raised by the generator and the verifier
#pragma once

#include <stdexcept>
#include <string>

namespace lamp {

// Invalid numeric parameters or inputs; raised before any output is produced
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Degenerate or non-manifold geometry; the mesh is never returned
class GeometryError : public std::runtime_error {
public:
  explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace lamp
