#include "zonemap/rollup.hpp"

#include <algorithm>
#include <map>
#include <set>

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"
#include "zonemap/projection.hpp"
#include "zonemap/repair.hpp"

namespace zonemap {

namespace {

// Parcels of one category while they are being counted.
struct Bucket {
  std::set<std::string> ids;
  std::vector<double> areas;
  std::optional<std::string> description;
};

auto to_record(const std::optional<std::string> &code, Bucket &bucket)
    -> RollupRecord {
  auto record = RollupRecord{};
  record.category_code = code;
  record.category_desc = bucket.description;
  record.parcel_count = bucket.ids.size();
  for (auto area : bucket.areas) {
    record.total_area += area;
  }
  record.median_area = median(std::move(bucket.areas));
  return record;
}

// Fills the ratios of a record from its polygon area.
void derive_rates(RollupRecord &record, double polygon_area,
                  double scope_area) {
  record.category_polygon_area = polygon_area;
  record.share_of_total_area = safe_ratio(polygon_area, scope_area);
  record.parcels_per_area =
      safe_ratio(static_cast<double>(record.parcel_count), polygon_area);
  record.parcel_area_ratio = safe_ratio(record.total_area, polygon_area);
}

}  // namespace

auto median(std::vector<double> values) -> double {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  auto middle = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[middle];
  }
  return (values[middle - 1] + values[middle]) / 2.0;
}

auto compute_rollups(const ResolvedMapping &mapping, const Config &config)
    -> std::vector<RollupRecord> {
  config.validate();

  auto reproject = std::optional<Reprojector>();
  auto buckets = std::map<std::string, Bucket>();
  auto unmatched = Bucket{};

  for (size_t ix = 0; ix < mapping.rows.size(); ++ix) {
    const auto &row = mapping.rows[ix];
    auto &bucket = row.category_code.has_value()
                       ? buckets[*row.category_code]
                       : unmatched;
    bucket.ids.insert(row.parcel_id);
    if (!bucket.description.has_value()) {
      bucket.description = row.category_desc;
    }
    if (!row.geometry.has_value()) {
      continue;
    }

    if (!reproject.has_value()) {
      if (!mapping.epsg.has_value()) {
        throw ContractError("resolved mapping has no coordinate reference");
      }
      reproject.emplace(*mapping.epsg, config.projected_epsg,
                        config.canonical_epsg);
    }
    auto projected = repair_geometry((*reproject)(*row.geometry), ix);
    bucket.areas.push_back(absolute_area(projected.geometry) *
                           config.area_unit_factor);
  }

  auto records = std::vector<RollupRecord>();
  records.reserve(buckets.size() + 1);
  for (auto &[code, bucket] : buckets) {
    records.push_back(to_record(code, bucket));
  }
  if (!unmatched.ids.empty()) {
    records.push_back(to_record(std::nullopt, unmatched));
  }

  spdlog::info("rolled up {} parcels into {} categories", mapping.rows.size(),
               records.size());
  return records;
}

auto merge_category_areas(const std::vector<RollupRecord> &rollups,
                          const DissolvedLayer &dissolved,
                          const Config &config) -> std::vector<RollupRecord> {
  config.validate();

  auto reproject = Reprojector(dissolved.epsg, config.projected_epsg,
                               config.canonical_epsg);
  auto polygon_areas = std::map<std::string, double>();
  double scope_area = 0.0;
  for (const auto &category : dissolved.categories) {
    auto area =
        absolute_area(reproject(category.geometry)) * config.area_unit_factor;
    polygon_areas[category.label] = area;
    scope_area += area;
  }

  auto merged = std::map<std::string, RollupRecord>();
  auto unmatched = std::optional<RollupRecord>();
  for (const auto &record : rollups) {
    if (record.category_code.has_value()) {
      merged[*record.category_code] = record;
    } else {
      unmatched = record;
    }
  }
  for (const auto &category : dissolved.categories) {
    auto &record = merged[category.label];
    record.category_code = category.label;
    if (!record.category_desc.has_value()) {
      record.category_desc = category.description;
    }
  }

  auto result = std::vector<RollupRecord>();
  result.reserve(merged.size() + 1);
  for (auto &[code, record] : merged) {
    auto it = polygon_areas.find(code);
    derive_rates(record, it == polygon_areas.end() ? 0.0 : it->second,
                 scope_area);
    result.push_back(std::move(record));
  }
  if (unmatched.has_value()) {
    derive_rates(*unmatched, 0.0, scope_area);
    result.push_back(std::move(*unmatched));
  }
  return result;
}

auto summarize(const ResolvedMapping &mapping) -> Summary {
  auto ids = std::set<std::string>();
  auto matched = std::set<std::string>();
  auto codes = std::set<std::string>();
  for (const auto &row : mapping.rows) {
    ids.insert(row.parcel_id);
    if (row.category_code.has_value()) {
      matched.insert(row.parcel_id);
      codes.insert(*row.category_code);
    }
  }
  auto summary = Summary{ids.size(), matched.size(), codes.size(), 0.0};
  summary.match_rate = safe_ratio(static_cast<double>(summary.matched_parcels),
                                  static_cast<double>(summary.total_parcels));
  return summary;
}

}  // namespace zonemap
