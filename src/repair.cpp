#include "zonemap/repair.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "zonemap/overlay.hpp"

namespace zonemap {

namespace {

/// Pair of a bounding box and the index of a ring segment.
using SegmentIndex = std::pair<Box, size_t>;

/// RTree index for the envelope of the segments of a ring.
using SegmentTree =
    bg::index::rtree<SegmentIndex, bg::index::rstar<16>>;

// Relative tolerance on segment parameters. Intersections closer than this
// to a vertex are snapped onto it.
constexpr double kEpsilon = 1e-12;

// Relative tolerance on the area preserved by the zero buffer.
constexpr double kAreaTolerance = 1e-9;

// A node to insert inside a segment, at parameter t along it.
struct Split {
  double t;
  Point point;
};

inline auto same_point(const Point &a, const Point &b) -> bool {
  return a.get<0>() == b.get<0>() && a.get<1>() == b.get<1>();
}

inline auto cross(double ax, double ay, double bx, double by) -> double {
  return ax * by - ay * bx;
}

// Vertices of a ring without the closing vertex and without consecutive
// duplicates.
auto open_vertices(const Ring &ring) -> std::vector<Point> {
  auto result = std::vector<Point>();
  result.reserve(ring.size());
  for (const auto &point : ring) {
    if (result.empty() || !same_point(result.back(), point)) {
      result.push_back(point);
    }
  }
  while (result.size() > 1 && same_point(result.front(), result.back())) {
    result.pop_back();
  }
  return result;
}

// Adds p as a node of [a, b] if it lies strictly inside the segment. Only
// called for points collinear with the segment.
void add_if_inside(const Point &a, const Point &b, const Point &p,
                   std::vector<Split> &splits) {
  auto rx = b.get<0>() - a.get<0>();
  auto ry = b.get<1>() - a.get<1>();
  auto t = ((p.get<0>() - a.get<0>()) * rx + (p.get<1>() - a.get<1>()) * ry) /
           (rx * rx + ry * ry);
  if (t > kEpsilon && t < 1 - kEpsilon) {
    splits.push_back({t, p});
  }
}

// Computes the crossings of [a, b] and [c, d] and records them as nodes of
// both segments. A crossing computed once is stored in both lists, so that
// the two copies compare equal.
void intersect(const Point &a, const Point &b, const Point &c, const Point &d,
               std::vector<Split> &on_ab, std::vector<Split> &on_cd) {
  auto rx = b.get<0>() - a.get<0>();
  auto ry = b.get<1>() - a.get<1>();
  auto sx = d.get<0>() - c.get<0>();
  auto sy = d.get<1>() - c.get<1>();
  auto qx = c.get<0>() - a.get<0>();
  auto qy = c.get<1>() - a.get<1>();
  auto scale = std::max(rx * rx + ry * ry, sx * sx + sy * sy);
  if (scale == 0) {
    return;
  }

  auto denominator = cross(rx, ry, sx, sy);
  if (std::abs(denominator) <= kEpsilon * scale) {
    if (std::abs(cross(qx, qy, rx, ry)) > kEpsilon * scale) {
      return;
    }
    // Collinear overlap: the endpoints of each segment become nodes of the
    // other one.
    add_if_inside(a, b, c, on_ab);
    add_if_inside(a, b, d, on_ab);
    add_if_inside(c, d, a, on_cd);
    add_if_inside(c, d, b, on_cd);
    return;
  }

  auto t = cross(qx, qy, sx, sy) / denominator;
  auto u = cross(qx, qy, rx, ry) / denominator;
  if (t < -kEpsilon || t > 1 + kEpsilon || u < -kEpsilon || u > 1 + kEpsilon) {
    return;
  }

  Point point;
  if (t <= kEpsilon) {
    point = a;
  } else if (t >= 1 - kEpsilon) {
    point = b;
  } else if (u <= kEpsilon) {
    point = c;
  } else if (u >= 1 - kEpsilon) {
    point = d;
  } else {
    point = Point(a.get<0>() + t * rx, a.get<1>() + t * ry);
  }

  if (t > kEpsilon && t < 1 - kEpsilon) {
    on_ab.push_back({t, point});
  }
  if (u > kEpsilon && u < 1 - kEpsilon) {
    on_cd.push_back({u, point});
  }
}

// Inserts a vertex at every self-intersection of a closed ring.
auto node_ring(const std::vector<Point> &vertices) -> std::vector<Point> {
  auto size = vertices.size();
  auto segment = [&vertices, size](size_t ix) {
    return Segment(vertices[ix], vertices[(ix + 1) % size]);
  };

  auto boxes = std::vector<SegmentIndex>();
  boxes.reserve(size);
  for (size_t ix = 0; ix < size; ++ix) {
    boxes.emplace_back(bg::return_envelope<Box>(segment(ix)), ix);
  }
  auto rtree = SegmentTree(boxes);

  auto splits = std::vector<std::vector<Split>>(size);
  auto candidates = std::vector<SegmentIndex>();
  for (size_t ix = 0; ix < size; ++ix) {
    candidates.clear();
    rtree.query(bg::index::intersects(boxes[ix].first),
                std::back_inserter(candidates));
    for (const auto &item : candidates) {
      auto jx = item.second;
      if (jx <= ix) {
        continue;
      }
      intersect(vertices[ix], vertices[(ix + 1) % size], vertices[jx],
                vertices[(jx + 1) % size], splits[ix], splits[jx]);
    }
  }

  auto result = std::vector<Point>();
  result.reserve(size);
  for (size_t ix = 0; ix < size; ++ix) {
    if (result.empty() || !same_point(result.back(), vertices[ix])) {
      result.push_back(vertices[ix]);
    }
    auto &nodes = splits[ix];
    std::sort(nodes.begin(), nodes.end(),
              [](const Split &lhs, const Split &rhs) { return lhs.t < rhs.t; });
    for (const auto &node : nodes) {
      if (!same_point(result.back(), node.point)) {
        result.push_back(node.point);
      }
    }
  }
  while (result.size() > 1 && same_point(result.front(), result.back())) {
    result.pop_back();
  }
  return result;
}

// Cuts a noded ring into simple loops at its repeated vertices. Loops
// without area are discarded. Each loop is returned as a correctly oriented
// polygon.
auto split_loops(const std::vector<Point> &noded) -> std::vector<MultiPolygon> {
  auto loops = std::vector<MultiPolygon>();
  if (noded.size() < 3) {
    return loops;
  }

  auto key = [](const Point &point) {
    return std::make_pair(point.get<0>(), point.get<1>());
  };
  auto stack = std::vector<Point>();
  auto position = std::map<std::pair<double, double>, size_t>();

  for (size_t ix = 0; ix <= noded.size(); ++ix) {
    const auto &point = noded[ix % noded.size()];
    auto it = position.find(key(point));
    if (it == position.end()) {
      position.emplace(key(point), stack.size());
      stack.push_back(point);
      continue;
    }

    auto from = it->second;
    auto polygon = Polygon();
    auto &outer = polygon.outer();
    outer.assign(stack.begin() + static_cast<std::ptrdiff_t>(from),
                 stack.end());
    outer.push_back(point);
    if (outer.size() >= 4 && absolute_area(polygon) > 0) {
      bg::correct(polygon);
      loops.push_back(MultiPolygon{std::move(polygon)});
    }

    for (auto jx = from + 1; jx < stack.size(); ++jx) {
      position.erase(key(stack[jx]));
    }
    stack.resize(from + 1);
  }
  return loops;
}

// The simple loops of a ring.
auto ring_loops(const Ring &ring) -> std::vector<MultiPolygon> {
  auto vertices = open_vertices(ring);
  if (vertices.size() < 3) {
    return {};
  }
  return split_loops(node_ring(vertices));
}

}  // namespace

auto make_valid(const MultiPolygon &geometry) -> MultiPolygon {
  if (bg::is_valid(geometry)) {
    return geometry;
  }

  auto parts = std::vector<MultiPolygon>();
  for (const auto &polygon : geometry) {
    // A loop nested in another loop of the same ring encloses a hole.
    auto shell = even_odd_union(ring_loops(polygon.outer()));
    if (bg::is_empty(shell)) {
      continue;
    }

    auto hole_rings = std::vector<MultiPolygon>();
    for (const auto &inner : polygon.inners()) {
      auto hole = even_odd_union(ring_loops(inner));
      if (!bg::is_empty(hole)) {
        hole_rings.push_back(std::move(hole));
      }
    }
    if (!hole_rings.empty()) {
      auto holes = cascade_union(std::move(hole_rings));
      MultiPolygon difference;
      bg::difference(shell, holes, difference);
      shell = std::move(difference);
    }
    parts.push_back(std::move(shell));
  }

  auto result = cascade_union(std::move(parts));
  std::string reason;
  if (!bg::is_valid(result, reason)) {
    throw std::runtime_error("geometry is still invalid after repair: " +
                             reason);
  }
  return result;
}

auto buffer_zero(const MultiPolygon &geometry) -> MultiPolygon {
  if (bg::is_empty(geometry) || bg::is_valid(geometry)) {
    return geometry;
  }
  try {
    bg::strategy::buffer::distance_symmetric<double> distance(0.0);
    bg::strategy::buffer::side_straight side;
    bg::strategy::buffer::join_miter join;
    bg::strategy::buffer::end_flat end;
    bg::strategy::buffer::point_square point;

    MultiPolygon buffered;
    bg::buffer(geometry, buffered, distance, side, join, end, point);

    auto before = absolute_area(geometry);
    auto after = absolute_area(buffered);
    if (bg::is_empty(buffered) || !bg::is_valid(buffered) ||
        std::abs(after - before) > kAreaTolerance * std::max(before, after)) {
      return geometry;
    }
    return buffered;
  } catch (const std::exception &ex) {
    spdlog::debug("zero buffer failed: {}", ex.what());
    return geometry;
  }
}

auto repair_geometry(const MultiPolygon &geometry, size_t row)
    -> RepairResult {
  auto result = RepairResult{geometry, std::nullopt};
  try {
    result.geometry = make_valid(geometry);
  } catch (const std::exception &ex) {
    result.geometry = geometry;
    result.error = RepairError{row, ex.what()};
  }

  result.geometry = buffer_zero(result.geometry);
  if (result.error.has_value() && bg::is_valid(result.geometry)) {
    spdlog::debug("row {}: repaired by the zero buffer after: {}", row,
                  result.error->message);
    result.error.reset();
  }
  return result;
}

auto repair_layer(const Layer &layer) -> RepairedLayer {
  auto repaired = RepairedLayer{};
  auto features = std::vector<Feature>();
  features.reserve(layer.size());

  const auto &rows = layer.features();
  for (size_t ix = 0; ix < rows.size(); ++ix) {
    const auto &feature = rows[ix];
    if (!feature.geometry.has_value() || bg::is_empty(*feature.geometry)) {
      ++repaired.dropped;
      continue;
    }

    auto result = repair_geometry(*feature.geometry, ix);
    if (!result.ok()) {
      spdlog::warn("row {} ({}): keeping the original geometry: {}", ix,
                   feature.id, result.error->message);
      repaired.fallback_rows.push_back(ix);
      repaired.errors.push_back(std::move(*result.error));
    } else if (bg::is_empty(result.geometry)) {
      spdlog::debug("row {} ({}): geometry collapsed to nothing", ix,
                    feature.id);
      ++repaired.dropped;
      continue;
    }

    auto copy = feature;
    copy.geometry = std::move(result.geometry);
    features.push_back(std::move(copy));
  }

  spdlog::info("repaired {} of {} rows ({} dropped, {} kept as is)",
               features.size() - repaired.fallback_rows.size(), rows.size(),
               repaired.dropped, repaired.fallback_rows.size());
  repaired.layer = layer.with_features(std::move(features));
  return repaired;
}

}  // namespace zonemap
