// Image decoding/encoding: PNG through libpng, binary Netpbm (P5/P6) directly
#pragma once

#include <optional>
#include <string>
#include "image/ImageGrid.hpp"

namespace lamp::image {

// Colour inputs are collapsed to luminance; alpha is dropped.
std::optional<ImageGrid> load_image(const std::string& path, std::string* err = nullptr);
std::optional<ImageGrid> load_png(const std::string& path, std::string* err = nullptr);
std::optional<ImageGrid> load_pnm(const std::string& path, std::string* err = nullptr);

// Values are clamped to [0,1] and quantized to 8 bits.
bool save_image(const std::string& path, const ImageGrid& img, std::string* err = nullptr);
bool save_png(const std::string& path, const ImageGrid& img, std::string* err = nullptr);
bool save_pgm(const std::string& path, const ImageGrid& img, std::string* err = nullptr);

} // namespace lamp::image
