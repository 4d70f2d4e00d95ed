#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <string>
#include "image/ImageIO.hpp"

using lamp::image::ImageGrid;

static int fail(const std::string& msg) { std::cerr << msg << "\n"; return 1; }

static ImageGrid gradient(int w, int h) {
  ImageGrid img(w, h);
  for (int y = 0; y < h; ++y)
    for (int x = 0; x < w; ++x)
      img.at(x, y) = static_cast<float>((x * 37 + y * 11) % 256) / 255.0f;
  return img;
}

static int compare(const ImageGrid& a, const ImageGrid& b, const std::string& what) {
  if (a.width != b.width || a.height != b.height) return fail(what + ": size mismatch");
  for (std::size_t i = 0; i < a.pixels.size(); ++i) {
    if (std::abs(a.pixels[i] - b.pixels[i]) > 1.0f / 255.0f + 1e-6f)
      return fail(what + ": pixel " + std::to_string(i) + " differs");
  }
  return 0;
}

int main() {
  const ImageGrid src = gradient(13, 7);
  std::string err;

  for (const std::string path : {"test_image_io.pgm", "test_image_io.png"}) {
    if (!lamp::image::save_image(path, src, &err)) return fail("save " + path + ": " + err);
    auto back = lamp::image::load_image(path, &err);
    if (!back) return fail("load " + path + ": " + err);
    if (int rc = compare(src, *back, path)) return rc;
    std::remove(path.c_str());
  }

  // Out-of-range values are clamped on write
  ImageGrid hot(2, 1);
  hot.at(0, 0) = -3.0f; hot.at(1, 0) = 7.5f;
  if (!lamp::image::save_png("test_image_io_clamp.png", hot, &err)) return fail("save clamp: " + err);
  auto clamped = lamp::image::load_png("test_image_io_clamp.png", &err);
  if (!clamped || clamped->at(0, 0) != 0.0f || clamped->at(1, 0) != 1.0f) return fail("clamping on write");
  std::remove("test_image_io_clamp.png");

  // P6 colour collapses to luminance
  {
    std::ofstream of("test_image_io_red.ppm", std::ios::binary);
    of << "P6\n# one red pixel\n1 1\n255\n";
    const unsigned char rgb[3] = {255, 0, 0};
    of.write(reinterpret_cast<const char*>(rgb), 3);
  }
  auto red = lamp::image::load_image("test_image_io_red.ppm", &err);
  if (!red) return fail("load ppm: " + err);
  if (std::abs(red->at(0, 0) - 0.299f) > 1e-3f) return fail("red luminance " + std::to_string(red->at(0, 0)));
  std::remove("test_image_io_red.ppm");

  // Truncated Netpbm payload
  {
    std::ofstream of("test_image_io_short.pgm", std::ios::binary);
    of << "P5\n4 4\n255\n" << "abc";
  }
  err.clear();
  if (lamp::image::load_pnm("test_image_io_short.pgm", &err) || err.empty()) return fail("truncated PGM accepted");
  std::remove("test_image_io_short.pgm");

  err.clear();
  if (lamp::image::load_image("does_not_exist.png", &err)) return fail("missing file accepted");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("missing PNG cause lost: " + err);
  err.clear();
  if (lamp::image::load_image("does_not_exist.pgm", &err)) return fail("missing PGM accepted");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("missing PGM cause lost: " + err);
  err.clear();
  if (lamp::image::save_image("no_such_dir/out.png", src, &err)) return fail("write into a missing directory succeeded");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("PNG write cause lost: " + err);
  err.clear();
  if (lamp::image::save_image("no_such_dir/out.pgm", src, &err)) return fail("write into a missing directory succeeded");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("PGM write cause lost: " + err);
  err.clear();
  if (lamp::image::load_image("picture.bmp", &err) || err.find("Unsupported") == std::string::npos)
    return fail("unsupported extension not reported");
  err.clear();
  if (lamp::image::save_image("empty.png", ImageGrid{}, &err) || err.empty()) return fail("empty image written");

  std::cout << "OK image io\n";
  return 0;
}
