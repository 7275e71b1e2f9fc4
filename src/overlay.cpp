#include "zonemap/overlay.hpp"

#include <queue>

namespace zonemap {

namespace {

// A helper function that computes the union of two multipolygons
inline auto multi_polygon_union(const MultiPolygon &mpoly1,
                                const MultiPolygon &mpoly2) -> MultiPolygon {
  MultiPolygon output;
  bg::union_(mpoly1, mpoly2, output);
  return output;
}

// Queue entry caching the area of its geometry. The sequence number breaks
// ties so that the merge order only depends on the input order.
struct QueueItem {
  double area;
  size_t sequence;
  MultiPolygon geometry;
};

// Comparator based on area to prioritize merging smaller multipolygons first
struct CompareArea {
  bool operator()(const QueueItem &a, const QueueItem &b) const {
    if (a.area != b.area) {
      return a.area > b.area;
    }
    return a.sequence > b.sequence;
  }
};

}  // namespace

auto cascade_union(std::vector<MultiPolygon> geometries) -> MultiPolygon {
  if (geometries.empty()) {
    return {};
  }
  std::priority_queue<QueueItem, std::vector<QueueItem>, CompareArea>
      polygon_queue;

  size_t sequence = 0;
  for (auto &item : geometries) {
    auto area = bg::area(item);
    polygon_queue.push({area, sequence++, std::move(item)});
  }

  while (polygon_queue.size() > 1) {
    // Extract two smallest multipolygons
    auto mpoly1 = polygon_queue.top();
    polygon_queue.pop();

    auto mpoly2 = polygon_queue.top();
    polygon_queue.pop();

    // Compute the union of the two multipolygons and push it back to the queue
    auto merged = multi_polygon_union(mpoly1.geometry, mpoly2.geometry);
    auto area = bg::area(merged);
    polygon_queue.push({area, sequence++, std::move(merged)});
  }

  return polygon_queue.top().geometry;
}

auto even_odd_union(const std::vector<MultiPolygon> &geometries)
    -> MultiPolygon {
  auto result = MultiPolygon();
  for (const auto &item : geometries) {
    MultiPolygon output;
    bg::sym_difference(result, item, output);
    result = std::move(output);
  }
  return result;
}

auto intersection_area(const MultiPolygon &lhs, const MultiPolygon &rhs)
    -> double {
  MultiPolygon output;
  bg::intersection(lhs, rhs, output);
  return bg::area(output);
}

}  // namespace zonemap
