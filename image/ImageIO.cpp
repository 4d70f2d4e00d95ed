#include "image/ImageIO.hpp"

#include <png.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdint>
#include <fstream>
#include <vector>

namespace lamp::image {

static inline std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static inline bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static inline std::uint8_t quantize(float v) {
  float c = std::max(0.0f, std::min(1.0f, v));
  return static_cast<std::uint8_t>(c * 255.0f + 0.5f);
}

// Rec.601 weights, the usual RGB -> "L" conversion
static inline float luma(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
  return (0.299f * r + 0.587f * g + 0.114f * b) / 255.0f;
}

std::optional<ImageGrid> load_image(const std::string& path, std::string* err) {
  auto lower = to_lower(path);
  if (ends_with(lower, ".png")) return load_png(path, err);
  if (ends_with(lower, ".pgm") || ends_with(lower, ".ppm") || ends_with(lower, ".pnm"))
    return load_pnm(path, err);
  if (err) *err = "Unsupported image extension: " + path;
  return std::nullopt;
}

bool save_image(const std::string& path, const ImageGrid& img, std::string* err) {
  auto lower = to_lower(path);
  if (ends_with(lower, ".png")) return save_png(path, img, err);
  if (ends_with(lower, ".pgm")) return save_pgm(path, img, err);
  if (err) *err = "Unsupported image extension: " + path;
  return false;
}

std::optional<ImageGrid> load_png(const std::string& path, std::string* err) {
  FILE* fp = std::fopen(path.c_str(), "rb");
  if (!fp) { if (err) *err = "Failed to open PNG: " + path + ": " + std::strerror(errno); return std::nullopt; }

  png_byte sig[8];
  if (std::fread(sig, 1, 8, fp) != 8 || png_sig_cmp(sig, 0, 8) != 0) {
    std::fclose(fp);
    if (err) *err = "Not a PNG file: " + path;
    return std::nullopt;
  }

  png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png) {
    std::fclose(fp);
    if (err) *err = "Failed to create PNG read struct";
    return std::nullopt;
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    std::fclose(fp);
    if (err) *err = "Failed to create PNG info struct";
    return std::nullopt;
  }

  // Everything with a destructor lives above setjmp so a longjmp skips nothing.
  ImageGrid img;
  std::vector<png_byte> buffer;
  std::vector<png_bytep> rows;

  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    std::fclose(fp);
    if (err) *err = "Corrupt PNG data: " + path;
    return std::nullopt;
  }

  png_init_io(png, fp);
  png_set_sig_bytes(png, 8);
  png_read_info(png, info);

  const png_uint_32 width = png_get_image_width(png, info);
  const png_uint_32 height = png_get_image_height(png, info);
  const png_byte color_type = png_get_color_type(png, info);
  const png_byte bit_depth = png_get_bit_depth(png, info);

  if (bit_depth == 16) png_set_strip_16(png);
  if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
  if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
  if (color_type & PNG_COLOR_MASK_ALPHA) png_set_strip_alpha(png);
  if (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_RGB_ALPHA ||
      color_type == PNG_COLOR_TYPE_PALETTE) {
    png_set_rgb_to_gray_fixed(png, 1, 29900, 58700);
  }
  png_read_update_info(png, info);

  if (png_get_channels(png, info) != 1) {
    png_destroy_read_struct(&png, &info, nullptr);
    std::fclose(fp);
    if (err) *err = "Unsupported PNG channel layout: " + path;
    return std::nullopt;
  }

  const std::size_t stride = png_get_rowbytes(png, info);
  buffer.resize(stride * height);
  rows.resize(height);
  for (png_uint_32 y = 0; y < height; ++y) rows[y] = buffer.data() + y * stride;
  png_read_image(png, rows.data());
  png_read_end(png, nullptr);
  png_destroy_read_struct(&png, &info, nullptr);
  std::fclose(fp);

  img = ImageGrid(static_cast<int>(width), static_cast<int>(height));
  for (png_uint_32 y = 0; y < height; ++y)
    for (png_uint_32 x = 0; x < width; ++x)
      img.at(static_cast<int>(x), static_cast<int>(y)) = rows[y][x] / 255.0f;
  return img;
}

bool save_png(const std::string& path, const ImageGrid& img, std::string* err) {
  if (img.empty()) { if (err) *err = "Refusing to write empty image: " + path; return false; }

  FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) { if (err) *err = "Failed to open for writing: " + path + ": " + std::strerror(errno); return false; }

  png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png) {
    std::fclose(fp);
    if (err) *err = "Failed to create PNG write struct";
    return false;
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_write_struct(&png, nullptr);
    std::fclose(fp);
    if (err) *err = "Failed to create PNG info struct";
    return false;
  }

  std::vector<png_byte> buffer(static_cast<std::size_t>(img.width) * img.height);
  std::vector<png_bytep> rows(static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    rows[y] = buffer.data() + static_cast<std::size_t>(y) * img.width;
    for (int x = 0; x < img.width; ++x) rows[y][x] = quantize(img.at(x, y));
  }

  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    std::fclose(fp);
    if (err) *err = "Error while encoding PNG: " + path;
    return false;
  }

  png_init_io(png, fp);
  png_set_IHDR(png, info, static_cast<png_uint_32>(img.width), static_cast<png_uint_32>(img.height), 8,
               PNG_COLOR_TYPE_GRAY, PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_write_image(png, rows.data());
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);

  if (std::fclose(fp) != 0) { if (err) *err = "Failed to flush PNG: " + path + ": " + std::strerror(errno); return false; }
  return true;
}

// Reads the next header integer, skipping whitespace and '#' comments.
static bool read_pnm_int(std::istream& in, int& out) {
  int c = in.peek();
  while (in && (std::isspace(c) || c == '#')) {
    if (c == '#') { std::string skip; std::getline(in, skip); }
    else in.get();
    c = in.peek();
  }
  return static_cast<bool>(in >> out);
}

std::optional<ImageGrid> load_pnm(const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { if (err) *err = "Failed to open PNM: " + path + ": " + std::strerror(errno); return std::nullopt; }

  std::string magic; in >> magic;
  if (magic != "P5" && magic != "P6") {
    if (err) *err = "Only binary P5/P6 Netpbm is supported: " + path;
    return std::nullopt;
  }
  int w = 0, h = 0, maxval = 0;
  if (!read_pnm_int(in, w) || !read_pnm_int(in, h) || !read_pnm_int(in, maxval)) {
    if (err) *err = "Malformed PNM header: " + path;
    return std::nullopt;
  }
  if (w <= 0 || h <= 0 || maxval <= 0 || maxval > 255) {
    if (err) *err = "Unsupported PNM dimensions or maxval: " + path;
    return std::nullopt;
  }
  in.get(); // single whitespace after maxval

  const int channels = (magic == "P6") ? 3 : 1;
  std::vector<std::uint8_t> raw(static_cast<std::size_t>(w) * h * channels);
  if (!in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()))) {
    if (err) *err = "Truncated PNM data: " + path;
    return std::nullopt;
  }

  ImageGrid img(w, h);
  const float scale = 255.0f / static_cast<float>(maxval);
  for (std::size_t i = 0; i < img.pixels.size(); ++i) {
    if (channels == 1) {
      img.pixels[i] = raw[i] * scale / 255.0f;
    } else {
      const std::uint8_t* p = &raw[i * 3];
      img.pixels[i] = std::min(1.0f, luma(p[0], p[1], p[2]) * scale);
    }
  }
  return img;
}

bool save_pgm(const std::string& path, const ImageGrid& img, std::string* err) {
  if (img.empty()) { if (err) *err = "Refusing to write empty image: " + path; return false; }
  std::ofstream of(path, std::ios::binary);
  if (!of) { if (err) *err = "Failed to open for writing: " + path + ": " + std::strerror(errno); return false; }
  of << "P5\n" << img.width << " " << img.height << "\n255\n";
  std::vector<std::uint8_t> raw(img.pixels.size());
  std::transform(img.pixels.begin(), img.pixels.end(), raw.begin(), quantize);
  of.write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
  if (!of) { if (err) *err = "Failed to write PGM: " + path + ": " + std::strerror(errno); return false; }
  return true;
}

} // namespace lamp::image
