#include "zonemap/dissolve.hpp"

#include <map>

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"
#include "zonemap/overlay.hpp"
#include "zonemap/projection.hpp"
#include "zonemap/repair.hpp"
#include "zonemap/resolver.hpp"

namespace zonemap {

auto dissolve(const Layer &zoning, const Config &config) -> DissolvedLayer {
  config.validate();
  zoning.require(Column::kCategoryCode, "zoning");

  // Strings cannot be unioned: the description of each label is chosen
  // before the geometries are merged.
  auto descriptions = describe_categories(zoning);

  auto work = to_crs(ensure_crs(zoning, config), config.projected_epsg, config);
  auto repaired = repair_layer(work);

  auto groups = std::map<std::string, std::vector<MultiPolygon>>();
  size_t unlabelled = 0;
  for (const auto &feature : repaired.layer.features()) {
    if (!feature.category_code.has_value()) {
      ++unlabelled;
      continue;
    }
    groups[*feature.category_code].push_back(*feature.geometry);
  }
  if (unlabelled != 0) {
    spdlog::warn("{} zoning polygons without category code left out of the "
                 "dissolve",
                 unlabelled);
  }

  auto to_canonical = Reprojector(config.projected_epsg, config.canonical_epsg,
                                  config.canonical_epsg);
  auto result = DissolvedLayer{};
  result.epsg = config.canonical_epsg;
  result.categories.reserve(groups.size());
  for (auto &[label, members] : groups) {
    auto count = members.size();
    auto merged = MultiPolygon();
    try {
      merged = cascade_union(std::move(members));
    } catch (const std::exception &ex) {
      throw TopologyError(label, ex.what());
    }

    auto category = DissolvedCategory{label, std::nullopt,
                                      to_canonical(merged), count};
    auto it = descriptions.find(label);
    if (it != descriptions.end()) {
      category.description = it->second;
    }
    result.categories.push_back(std::move(category));
  }

  spdlog::info("dissolved {} zoning polygons into {} categories",
               repaired.layer.size(), result.categories.size());
  return result;
}

}  // namespace zonemap
