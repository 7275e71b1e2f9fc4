#include "zonemap/pipeline.hpp"

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"
#include "zonemap/projection.hpp"
#include "zonemap/spatial_join.hpp"

namespace zonemap {

auto run_pipeline(const Layer &parcels, const Layer &zoning,
                  const Config &config, const Scope &scope) -> PipelineResult {
  config.validate();
  parcels.require(Column::kId, "parcel");
  zoning.require(Column::kCategoryCode, "zoning");
  if (scope.jurisdictions.has_value()) {
    zoning.require(Column::kJurisdiction, "zoning");
    if (scope.jurisdictions->empty()) {
      throw ContractError("no jurisdiction selected");
    }
  }

  auto parcels_canonical = ensure_crs(parcels, config);
  auto zoning_canonical = ensure_crs(zoning, config);

  auto repaired = repair_layer(zoning_canonical);
  auto candidates = spatial_join(parcels_canonical, repaired.layer);
  auto mapping =
      resolve_overlaps(candidates, parcels_canonical, repaired.layer, config);

  auto zoning_scope = zoning_canonical;
  if (scope.jurisdictions.has_value()) {
    zoning_scope =
        filter_by_jurisdiction(zoning_canonical, *scope.jurisdictions);
    spdlog::info("{} of {} zoning polygons in the selected jurisdictions",
                 zoning_scope.size(), zoning_canonical.size());
  }
  auto dissolved = dissolve(zoning_scope, config);

  auto parcels_scope = scope.jurisdictions.has_value()
                           ? filter_by_categories(mapping,
                                                  category_codes(zoning_scope))
                           : mapping;
  auto rollups = merge_category_areas(compute_rollups(parcels_scope, config),
                                      dissolved, config);
  auto summary = summarize(parcels_scope);

  spdlog::info("parcels in scope: {}, matched: {} ({:.2f}%), categories: {}",
               summary.total_parcels, summary.matched_parcels,
               summary.match_rate * 100.0, summary.distinct_categories);

  return {std::move(mapping), std::move(dissolved), std::move(rollups),
          summary, std::move(repaired.errors)};
}

}  // namespace zonemap
