#pragma once

#include <optional>
#include <string>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/dissolve.hpp"
#include "zonemap/resolver.hpp"

namespace zonemap {

/// @brief Aggregates of one category. Areas are in the display unit of the
/// configuration.
struct RollupRecord {
  /// Null for the bucket of unmatched parcels.
  std::optional<std::string> category_code;
  std::optional<std::string> category_desc;
  /// Number of distinct parcel ids.
  size_t parcel_count{0};
  /// Sum of the parcel areas.
  double total_area{0};
  /// Median of the parcel areas.
  double median_area{0};
  /// Area of the dissolved category polygon.
  double category_polygon_area{0};
  /// Share of the category in the dissolved area of the scope.
  double share_of_total_area{0};
  /// parcel_count / category_polygon_area, 0 for an empty polygon.
  double parcels_per_area{0};
  /// total_area / category_polygon_area, 0 for an empty polygon.
  double parcel_area_ratio{0};
};

/// @brief Headline figures of a mapping.
struct Summary {
  size_t total_parcels{0};
  size_t matched_parcels{0};
  size_t distinct_categories{0};
  /// matched_parcels / total_parcels, 0 without parcels.
  double match_rate{0};
};

/// @brief Division yielding 0 when the denominator is 0.
constexpr auto safe_ratio(double numerator, double denominator) noexcept
    -> double {
  return denominator == 0.0 ? 0.0 : numerator / denominator;
}

/// @brief Median of a list of values, 0 for an empty list.
auto median(std::vector<double> values) -> double;

/// @brief Counts parcels and measures their areas per category.
///
/// Parcel geometries are reprojected to Config::projected_epsg and measured
/// there, then converted with Config::area_unit_factor. Rows without
/// geometry are counted but not measured. Categories are sorted by code, the
/// unmatched bucket comes last.
///
/// @throw ContractError if the mapping has geometries but no reference.
auto compute_rollups(const ResolvedMapping &mapping, const Config &config)
    -> std::vector<RollupRecord>;

/// @brief Merges the rollups with the dissolved category polygons.
///
/// Every category of either input appears once. Categories without parcels
/// get a zero count, categories without a polygon get a zero polygon area.
/// Shares and rates are derived from the polygon areas of the dissolved
/// layer, with 0 wherever the denominator is 0.
auto merge_category_areas(const std::vector<RollupRecord> &rollups,
                          const DissolvedLayer &dissolved,
                          const Config &config) -> std::vector<RollupRecord>;

/// @brief Headline figures of a mapping.
auto summarize(const ResolvedMapping &mapping) -> Summary;

}  // namespace zonemap
