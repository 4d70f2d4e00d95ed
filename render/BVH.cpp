#include "render/BVH.hpp"
#include "core/units.hpp"

#include <cmath>
#include <stack>

namespace lamp::render {

using lamp::geom::Triangle;

// Boxes are padded so rounding in the slab test never culls a triangle hit.
static constexpr double kBoxPad = 1e-7;
static constexpr int kLeafSize = 8;

Aabb BVHIntersector::tri_bounds(const Triangle& t) {
  Aabb b; b.expand(t.v0); b.expand(t.v1); b.expand(t.v2); return b;
}

BVHIntersector::BVHIntersector(std::vector<Triangle> tris) : m_tris(std::move(tris)) {
  m_indices.resize(m_tris.size());
  m_centroids.reserve(m_tris.size());
  for (std::size_t i = 0; i < m_tris.size(); ++i) {
    m_indices[i] = static_cast<int>(i);
    const Triangle& t = m_tris[i];
    m_centroids.push_back((t.v0 + t.v1 + t.v2) / 3.0);
  }
  m_nodes.reserve(2 * m_tris.size());
  if (!m_tris.empty()) build_node(0, static_cast<int>(m_tris.size()));
}

int BVHIntersector::build_node(int start, int count) {
  const auto first = m_indices.begin() + start;
  const auto last = first + count;

  BVHNode node;
  node.start = start;
  node.count = count;
  node.leaf = count <= kLeafSize;
  Aabb centroid_box;
  for (auto it = first; it != last; ++it) {
    node.box.expand(tri_bounds(m_tris[*it]));
    centroid_box.expand(m_centroids[*it]);
  }
  node.box.pad(kBoxPad);

  const int idx = static_cast<int>(m_nodes.size());
  m_nodes.push_back(node);
  if (node.leaf) return idx;

  // median split along the widest centroid extent
  const lamp::Vec3 e = centroid_box.extent();
  int axis = 0;
  if (e.y > e.x && e.y >= e.z) axis = 1;
  else if (e.z > e.x && e.z >= e.y) axis = 2;

  const int half = count / 2;
  std::nth_element(first, first + half, last, [&](int a, int b) {
    return component(m_centroids[a], axis) < component(m_centroids[b], axis);
  });

  const int left = build_node(start, half);
  const int right = build_node(start + half, count - half);
  m_nodes[idx].left = left;
  m_nodes[idx].right = right;
  return idx;
}

template <class Fn>
void BVHIntersector::traverse(const Ray& r, const double* t_max, Fn&& fn) const {
  if (m_nodes.empty()) return;
  std::stack<int> st; st.push(0);
  while (!st.empty()) {
    int ni = st.top(); st.pop();
    const BVHNode& n = m_nodes[ni];
    if (!n.box.intersect(r.o, r.d, *t_max + kBoxPad)) continue;
    if (n.leaf) {
      for (int i = 0; i < n.count; ++i) {
        if (fn(m_indices[n.start + i])) return;
      }
    } else {
      st.push(n.left);
      st.push(n.right);
    }
  }
}

Hit BVHIntersector::closest(const Ray& r) const {
  Hit h;
  double t_best = std::numeric_limits<double>::infinity();
  traverse(r, &t_best, [&](int idx) {
    double t = 0.0;
    TriHit k = intersect_triangle(r, m_tris[idx], t);
    if (k == TriHit::Parallel) h.grazing++;
    else if (k == TriHit::Hit && t < t_best) t_best = t;
    return false;
  });
  if (!std::isfinite(t_best)) return h;

  const double t_tie = t_best + lamp::units::tie_eps;
  traverse(r, &t_tie, [&](int idx) {
    double t = 0.0;
    if (intersect_triangle(r, m_tris[idx], t) == TriHit::Hit && t <= t_tie &&
        (h.tri < 0 || idx < h.tri)) {
      h.tri = idx; h.t = t;
    }
    return false;
  });
  return h;
}

bool BVHIntersector::any_hit(const Ray& r, double t_max, std::size_t* grazing) const {
  bool found = false;
  traverse(r, &t_max, [&](int idx) {
    double t = 0.0;
    TriHit k = intersect_triangle(r, m_tris[idx], t);
    if (k == TriHit::Parallel) { if (grazing) (*grazing)++; return false; }
    found = (k == TriHit::Hit && t < t_max);
    return found;
  });
  return found;
}

} // namespace lamp::render
