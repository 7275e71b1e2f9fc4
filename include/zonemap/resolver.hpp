#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/layer.hpp"
#include "zonemap/spatial_join.hpp"

namespace zonemap {

/// @brief One parcel and the single category it was assigned.
struct ResolvedRow {
  std::string parcel_id;
  /// Null only if the parcel intersects no zoning polygon.
  std::optional<std::string> category_code;
  /// Representative description of the category (best effort).
  std::optional<std::string> category_desc;
  std::optional<int> jurisdiction;
  /// Geometry of the parcel, in the reference of the mapping.
  std::optional<MultiPolygon> geometry;
};

/// @brief The one-to-one parcel to category table.
struct ResolvedMapping {
  /// One row per distinct parcel id, in parcel layer order.
  std::vector<ResolvedRow> rows;
  /// Reference of the parcel geometries.
  std::optional<int> epsg;
  /// Number of parcels that matched more than one category.
  size_t multi_match{0};
};

/// @brief First non-null description of each category code, in row order.
///
/// The zoning source does not guarantee a single description per code, so
/// this lookup is a display label, not an authoritative attribute.
auto describe_categories(const Layer &zoning)
    -> std::map<std::string, std::string>;

/// @brief Picks the category with the largest overlap area.
///
/// Exactly equal areas, zero included, resolve to the lexicographically
/// smallest code.
///
/// @param[in] areas Overlap area per category code.
/// @return The selected code, nothing if there is no candidate.
auto select_category(const std::map<std::string, double> &areas)
    -> std::optional<std::string>;

/// @brief Reduces the candidate relation to one category per parcel.
///
/// Parcels matching a single category take it directly. For parcels matching
/// several categories, the parcel and its candidate zoning polygons are
/// reprojected to Config::projected_epsg and the category with the largest
/// intersection area is kept.
///
/// @param[in] candidates The output of spatial_join.
/// @param[in] parcels The parcel layer the candidates refer to.
/// @param[in] zoning The zoning layer the candidates refer to.
/// @param[in] config The deployment constants.
/// @throw ContractError if a required column or reference is missing.
auto resolve_overlaps(const std::vector<CandidateMatch> &candidates,
                      const Layer &parcels, const Layer &zoning,
                      const Config &config) -> ResolvedMapping;

/// @brief Keeps the rows whose category is one of the given codes.
auto filter_by_categories(const ResolvedMapping &mapping,
                          const std::set<std::string> &codes)
    -> ResolvedMapping;

}  // namespace zonemap
