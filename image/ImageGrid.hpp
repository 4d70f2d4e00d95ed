// Single-channel brightness raster, row-major, values in [0,1]
#pragma once

#include <cstddef>
#include <vector>

namespace lamp::image {

struct ImageGrid {
  int width{0};
  int height{0};
  std::vector<float> pixels; // row 0 is the top row

  ImageGrid() = default;
  ImageGrid(int w, int h, float fill = 0.0f)
    : width(w), height(h), pixels(static_cast<std::size_t>(w > 0 && h > 0 ? w * h : 0), fill) {}

  bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

  float at(int x, int y) const { return pixels[static_cast<std::size_t>(y) * width + x]; }
  float& at(int x, int y) { return pixels[static_cast<std::size_t>(y) * width + x]; }
};

} // namespace lamp::image
