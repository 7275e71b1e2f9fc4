#pragma once

#include <optional>
#include <string>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/layer.hpp"

namespace zonemap {

/// @brief The union of all zoning polygons sharing a label.
struct DissolvedCategory {
  /// Label derived from the category code.
  std::string label;
  /// First non-null description of the label, looked up before the union.
  std::optional<std::string> description;
  /// Union of the member polygons, possibly multi-part.
  MultiPolygon geometry;
  /// Number of zoning polygons merged into this category.
  size_t members{0};
};

/// @brief One polygon per category, in ascending label order.
struct DissolvedLayer {
  std::vector<DissolvedCategory> categories;
  /// Reference of the geometries: the canonical code.
  int epsg{0};
};

/// @brief Dissolves a zoning layer by category code.
///
/// The layer is reprojected to Config::projected_epsg, repaired, grouped by
/// label and unioned group by group; the result is reprojected back to
/// Config::canonical_epsg. Rows without a category code are left out.
///
/// @param[in] zoning The zoning layer, with a category_code column.
/// @param[in] config The deployment constants.
/// @throw ContractError if the category_code column is missing.
/// @throw TopologyError if the union of a group fails.
auto dissolve(const Layer &zoning, const Config &config) -> DissolvedLayer;

}  // namespace zonemap
