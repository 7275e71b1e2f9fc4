#include "zonemap/spatial_join.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"

namespace zonemap {

ZoningIndex::ZoningIndex(const Layer &zoning) : zoning_(zoning) {
  std::vector<RowIndex> ptr;
  ptr.reserve(zoning.size());
  const auto &rows = zoning.features();
  for (size_t ix = 0; ix < rows.size(); ++ix) {
    const auto &feature = rows[ix];
    if (!feature.category_code.has_value() || !feature.geometry.has_value() ||
        bg::is_empty(*feature.geometry)) {
      continue;
    }
    ptr.emplace_back(bg::return_envelope<Box>(*feature.geometry), ix);
  }
  rtree_ = std::make_unique<RTree>(ptr);
}

auto ZoningIndex::intersecting(const MultiPolygon &geometry) const
    -> std::vector<size_t> {
  auto result = std::vector<size_t>();
  if (bg::is_empty(geometry)) {
    return result;
  }

  // Query the RTree index for the zoning polygons that intersect the
  // envelope, then keep the ones whose geometry really intersects.
  auto envelope = bg::return_envelope<Box>(geometry);
  std::vector<RowIndex> candidates;
  rtree_->query(bg::index::intersects(envelope),
                std::back_inserter(candidates));
  for (const auto &item : candidates) {
    if (bg::intersects(geometry, *zoning_.features()[item.second].geometry)) {
      result.push_back(item.second);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

auto spatial_join(const Layer &parcels, const Layer &zoning)
    -> std::vector<CandidateMatch> {
  parcels.require(Column::kId, "parcel");
  zoning.require(Column::kCategoryCode, "zoning");
  if (!parcels.epsg().has_value() || !zoning.epsg().has_value()) {
    throw ContractError("spatial join requires both layers to carry a "
                        "coordinate reference");
  }
  if (*parcels.epsg() != *zoning.epsg()) {
    throw ContractError("spatial join requires a shared coordinate reference"
                        ", got EPSG:" + std::to_string(*parcels.epsg()) +
                        " and EPSG:" + std::to_string(*zoning.epsg()));
  }

  auto index = ZoningIndex(zoning);
  auto result = std::vector<CandidateMatch>();
  size_t matched = 0;

  const auto &rows = parcels.features();
  for (size_t ix = 0; ix < rows.size(); ++ix) {
    const auto &parcel = rows[ix];
    if (!parcel.geometry.has_value()) {
      continue;
    }
    auto hits = index.intersecting(*parcel.geometry);
    if (!hits.empty()) {
      ++matched;
    }
    for (auto jx : hits) {
      result.push_back({ix, jx, parcel.id,
                        *zoning.features()[jx].category_code});
    }
  }

  spdlog::info("join coverage: {}/{} parcels intersect {} indexed zoning "
               "polygons ({} pairs)",
               matched, rows.size(), index.size(), result.size());
  return result;
}

}  // namespace zonemap
