#include "zonemap/resolver.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"
#include "zonemap/overlay.hpp"
#include "zonemap/parallel_for.hpp"
#include "zonemap/projection.hpp"
#include "zonemap/repair.hpp"

namespace zonemap {

namespace {

/// Candidate zoning rows of one parcel, grouped by category code.
using CategoryRows = std::map<std::string, std::vector<size_t>>;

// Overlap area of a parcel with each of its candidate categories, measured
// in the projected reference.
auto overlap_areas(const std::optional<MultiPolygon> &parcel,
                   const CategoryRows &categories,
                   const std::map<size_t, MultiPolygon> &zoning)
    -> std::map<std::string, double> {
  auto areas = std::map<std::string, double>();
  for (const auto &item : categories) {
    areas[item.first] = 0.0;
  }
  if (!parcel.has_value()) {
    return areas;
  }

  for (const auto &[code, rows] : categories) {
    auto members = std::vector<MultiPolygon>();
    for (auto row : rows) {
      auto it = zoning.find(row);
      if (it != zoning.end()) {
        members.push_back(it->second);
      }
    }
    if (members.empty()) {
      continue;
    }
    // Same-category polygons are merged first so that their overlaps are
    // not counted twice.
    areas[code] =
        intersection_area(*parcel, cascade_union(std::move(members)));
  }
  return areas;
}

}  // namespace

auto describe_categories(const Layer &zoning)
    -> std::map<std::string, std::string> {
  auto lookup = std::map<std::string, std::string>();
  for (const auto &feature : zoning.features()) {
    if (feature.category_code.has_value() &&
        feature.category_desc.has_value()) {
      lookup.emplace(*feature.category_code, *feature.category_desc);
    }
  }
  return lookup;
}

auto select_category(const std::map<std::string, double> &areas)
    -> std::optional<std::string> {
  auto best = std::optional<std::string>();
  double best_area = 0.0;
  for (const auto &[code, area] : areas) {
    if (!best.has_value() || area > best_area) {
      best = code;
      best_area = area;
    }
  }
  return best;
}

auto resolve_overlaps(const std::vector<CandidateMatch> &candidates,
                      const Layer &parcels, const Layer &zoning,
                      const Config &config) -> ResolvedMapping {
  config.validate();
  parcels.require(Column::kId, "parcel");
  zoning.require(Column::kCategoryCode, "zoning");
  if (!parcels.epsg().has_value() || !zoning.epsg().has_value()) {
    throw ContractError("overlap resolution requires both layers to carry a "
                        "coordinate reference");
  }

  // One slot per distinct parcel id, the first row wins.
  const auto &parcel_rows = parcels.features();
  auto slot_of = std::unordered_map<std::string, size_t>();
  auto slot_rows = std::vector<size_t>();
  for (size_t ix = 0; ix < parcel_rows.size(); ++ix) {
    if (slot_of.emplace(parcel_rows[ix].id, slot_rows.size()).second) {
      slot_rows.push_back(ix);
    } else {
      spdlog::warn("duplicate parcel id '{}' at row {} ignored",
                   parcel_rows[ix].id, ix);
    }
  }

  auto categories = std::vector<CategoryRows>(slot_rows.size());
  for (const auto &match : candidates) {
    auto it = slot_of.find(match.parcel_id);
    if (it == slot_of.end()) {
      spdlog::warn("candidate refers to unknown parcel id '{}'",
                   match.parcel_id);
      continue;
    }
    categories[it->second][match.category_code].push_back(match.zoning_row);
  }

  auto chosen = std::vector<std::optional<std::string>>(slot_rows.size());
  auto multi = std::vector<size_t>();
  for (size_t slot = 0; slot < slot_rows.size(); ++slot) {
    if (categories[slot].size() > 1) {
      multi.push_back(slot);
    } else if (categories[slot].size() == 1) {
      chosen[slot] = categories[slot].begin()->first;
    }
  }

  spdlog::info("parcels total: {}", slot_rows.size());
  spdlog::info("parcels with multiple zoning matches: {}", multi.size());

  if (!multi.empty()) {
    auto to_parcel = Reprojector(*parcels.epsg(), config.projected_epsg,
                                 config.canonical_epsg);
    auto to_zoning = Reprojector(*zoning.epsg(), config.projected_epsg,
                                 config.canonical_epsg);

    // Projected copies of every zoning polygon a multi-match parcel refers
    // to.
    auto projected_zoning = std::map<size_t, MultiPolygon>();
    for (auto slot : multi) {
      for (const auto &[code, rows] : categories[slot]) {
        for (auto row : rows) {
          if (projected_zoning.count(row) != 0) {
            continue;
          }
          if (row >= zoning.size() ||
              !zoning.features()[row].geometry.has_value()) {
            spdlog::warn("zoning row {} ({}) has no geometry; its overlap "
                         "with parcel '{}' counts as zero",
                         row, code, parcel_rows[slot_rows[slot]].id);
            continue;
          }
          projected_zoning.emplace(
              row, to_zoning(*zoning.features()[row].geometry));
        }
      }
    }

    // Each worker writes only the slots of its own partition.
    auto worker = [&](size_t start, size_t stop) {
      for (auto ix = start; ix < stop; ++ix) {
        auto slot = multi[ix];
        const auto &parcel = parcel_rows[slot_rows[slot]];
        auto geometry = std::optional<MultiPolygon>();
        if (parcel.geometry.has_value()) {
          auto repaired =
              repair_geometry(to_parcel(*parcel.geometry), slot_rows[slot]);
          geometry = std::move(repaired.geometry);
        }
        auto areas =
            overlap_areas(geometry, categories[slot], projected_zoning);
        chosen[slot] = select_category(areas);
        spdlog::debug("parcel '{}' resolved to '{}' among {} categories",
                      parcel.id, *chosen[slot], areas.size());
      }
    };
    parallel_for(worker, multi.size(), config.num_threads,
                 config.min_parallel_size);
  }

  auto descriptions = describe_categories(zoning);
  auto mapping = ResolvedMapping{};
  mapping.epsg = parcels.epsg();
  mapping.multi_match = multi.size();
  mapping.rows.reserve(slot_rows.size());
  size_t matched = 0;
  for (size_t slot = 0; slot < slot_rows.size(); ++slot) {
    const auto &parcel = parcel_rows[slot_rows[slot]];
    auto row = ResolvedRow{parcel.id, chosen[slot], std::nullopt,
                           parcel.jurisdiction, parcel.geometry};
    if (row.category_code.has_value()) {
      ++matched;
      auto it = descriptions.find(*row.category_code);
      if (it != descriptions.end()) {
        row.category_desc = it->second;
      }
    }
    mapping.rows.push_back(std::move(row));
  }

  spdlog::info("matched category: {}/{} ({:.2f}%)", matched,
               mapping.rows.size(),
               mapping.rows.empty()
                   ? 0.0
                   : 100.0 * static_cast<double>(matched) /
                         static_cast<double>(mapping.rows.size()));
  return mapping;
}

auto filter_by_categories(const ResolvedMapping &mapping,
                          const std::set<std::string> &codes)
    -> ResolvedMapping {
  auto result = ResolvedMapping{{}, mapping.epsg, mapping.multi_match};
  for (const auto &row : mapping.rows) {
    if (row.category_code.has_value() && codes.count(*row.category_code) != 0) {
      result.rows.push_back(row);
    }
  }
  return result;
}

}  // namespace zonemap
