#pragma once

#include <optional>
#include <set>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/dissolve.hpp"
#include "zonemap/layer.hpp"
#include "zonemap/repair.hpp"
#include "zonemap/resolver.hpp"
#include "zonemap/rollup.hpp"

namespace zonemap {

/// @brief Restricts the dissolve and the rollups to part of the county.
struct Scope {
  /// Jurisdictions to keep. Unset keeps every zoning polygon.
  std::optional<std::set<int>> jurisdictions;
};

/// @brief Everything a run produces.
struct PipelineResult {
  /// One category per parcel, over the whole parcel layer.
  ResolvedMapping mapping;
  /// Category polygons of the zoning in scope.
  DissolvedLayer dissolved;
  /// Rollups of the parcels in scope merged with the category polygons.
  std::vector<RollupRecord> rollups;
  /// Headline figures of the parcels in scope.
  Summary summary;
  /// Repair outcome of the zoning layer before the join.
  std::vector<RepairError> zoning_repair_errors;
};

/// @brief Runs the whole batch: repair, join, resolve, dissolve, roll up.
///
/// Both layers are first brought into the canonical reference. No output is
/// produced unless every stage succeeds.
///
/// @param[in] parcels The parcel layer, with an id column.
/// @param[in] zoning The zoning layer, with a category_code column.
/// @param[in] config The deployment constants.
/// @param[in] scope The jurisdictions to report on.
/// @throw ContractError for a missing column, an unusable configuration or
/// an empty jurisdiction selection.
/// @throw TopologyError if the dissolve fails.
auto run_pipeline(const Layer &parcels, const Layer &zoning,
                  const Config &config, const Scope &scope = {})
    -> PipelineResult;

}  // namespace zonemap
