#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include "geom/DiskBuilder.hpp"
#include "geom/Mesh.hpp"
#include "geom/Topology.hpp"
#include "image/ImageGrid.hpp"

using lamp::geom::Mesh;

static int fail(const std::string& msg) { std::cerr << msg << "\n"; return 1; }

static std::string read_all(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static Mesh make_disk() {
  lamp::image::ImageGrid img(24, 24);
  std::mt19937 rng(3);
  std::uniform_real_distribution<float> u(0.0f, 1.0f);
  for (auto& p : img.pixels) p = u(rng);
  lamp::geom::DiskParams d{60.0, 20.0, 6, 48};
  lamp::geom::HeightParams hp; hp.base_thickness = 1.0; hp.relief_scale = 5.0; hp.hole_fraction = 20.0 / 60.0;
  lamp::geom::HeightfieldSampler s(img, hp);
  return lamp::geom::build_disk(d, s);
}

int main() {
  const Mesh disk = make_disk();
  const std::string path = "test_stl_disk.stl";
  std::string err;
  if (!disk.saveSTL(path, &err)) return fail("saveSTL failed: " + err);

  // Layout: 80-byte header, LE facet count, 50 bytes per facet
  const std::string bytes = read_all(path);
  if (bytes.size() != 84 + 50 * disk.face_count()) return fail("unexpected STL size " + std::to_string(bytes.size()));
  const auto* b = reinterpret_cast<const unsigned char*>(bytes.data());
  std::uint32_t count = b[80] | (b[81] << 8) | (b[82] << 16) | (static_cast<std::uint32_t>(b[83]) << 24);
  if (count != disk.face_count()) return fail("facet count in header is " + std::to_string(count));
  if (b[84 + 48] != 0 || b[84 + 49] != 0) return fail("attribute bytes not zero");

  // Round trip: same faces in the same order, positions within 1e-5 mm
  auto loaded = Mesh::load(path, &err);
  if (!loaded) return fail("load failed: " + err);
  if (loaded->face_count() != disk.face_count()) return fail("face count changed on reload");
  if (loaded->vertex_count() != disk.vertex_count()) return fail("vertex count changed on reload: " +
                                                                 std::to_string(loaded->vertex_count()));
  for (std::size_t i = 0; i < disk.face_count(); ++i) {
    auto a = disk.triangle(i), c = loaded->triangle(i);
    double e = std::max({(a.v0 - c.v0).norm(), (a.v1 - c.v1).norm(), (a.v2 - c.v2).norm()});
    if (e > 1e-5) return fail("vertex drift " + std::to_string(e) + " on face " + std::to_string(i));
  }
  if (!lamp::geom::check_topology(*loaded).watertight()) return fail("reloaded disk not watertight");

  // ASCII fallback
  {
    const std::string apath = "test_stl_tetra.stl";
    std::ofstream of(apath);
    of << "solid tetra\n";
    auto facet = [&](const char* a, const char* b2, const char* c) {
      of << " facet normal 0 0 0\n  outer loop\n   vertex " << a << "\n   vertex " << b2
         << "\n   vertex " << c << "\n  endloop\n endfacet\n";
    };
    facet("0 0 0", "0 1 0", "1 0 0");
    facet("0 0 0", "1 0 0", "0 0 1");
    facet("0 0 0", "0 0 1", "0 1 0");
    facet("1 0 0", "0 1 0", "0 0 1");
    of << "endsolid tetra\n";
    of.close();
    auto tet = Mesh::loadSTL(apath, &err);
    if (!tet) return fail("ASCII STL rejected: " + err);
    if (tet->face_count() != 4 || tet->vertex_count() != 4) return fail("ASCII tetra counts");
    if (!lamp::geom::check_topology(*tet).watertight()) return fail("ASCII tetra not watertight");
    if (!(std::abs(lamp::geom::signed_volume(*tet) - 1.0 / 6.0) < 1e-12)) return fail("ASCII tetra volume");
  }

  // Truncated binary file is an I/O error with the cause preserved
  {
    const std::string tpath = "test_stl_truncated.stl";
    std::ofstream of(tpath, std::ios::binary);
    of.write(bytes.data(), static_cast<std::streamsize>(bytes.size() - 10));
    of.close();
    err.clear();
    if (Mesh::load(tpath, &err)) return fail("truncated STL accepted");
    if (err.find("Truncated") == std::string::npos) return fail("truncation not reported: " + err);
  }

  err.clear();
  if (Mesh::load("does_not_exist.stl", &err)) return fail("missing file not reported");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("missing STL cause lost: " + err);
  err.clear();
  if (disk.saveSTL("no_such_dir/out.stl", &err)) return fail("write into a missing directory succeeded");
  if (err.find(std::strerror(ENOENT)) == std::string::npos) return fail("STL write cause lost: " + err);
  err.clear();
  if (Mesh::load("mesh.obj", &err) || err.empty()) return fail("unsupported extension not reported");

  return 0;
}
