#include "zonemap/layer.hpp"

#include <algorithm>

#include "zonemap/error.hpp"

namespace zonemap {

auto to_string(Column column) -> std::string {
  switch (column) {
    case Column::kId:
      return "id";
    case Column::kCategoryCode:
      return "category_code";
    case Column::kCategoryDesc:
      return "category_desc";
    case Column::kJurisdiction:
      return "jurisdiction";
  }
  return "unknown";
}

auto Layer::require(Column column, const std::string &context) const -> void {
  if (!has_column(column)) {
    throw ContractError(context + " layer is missing required column '" +
                        to_string(column) + "'");
  }
}

auto resolve_id_column(const std::vector<std::string> &columns,
                       const std::vector<std::string> &candidates,
                       const std::optional<std::string> &fallback)
    -> std::optional<std::string> {
  auto present = [&columns](const std::string &name) {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
  };
  for (const auto &candidate : candidates) {
    if (present(candidate)) {
      return candidate;
    }
  }
  if (fallback.has_value() && present(*fallback)) {
    return fallback;
  }
  return std::nullopt;
}

auto synthesize_ids(size_t count) -> std::vector<std::string> {
  auto ids = std::vector<std::string>();
  ids.reserve(count);
  for (size_t ix = 0; ix < count; ++ix) {
    ids.push_back(std::to_string(ix));
  }
  return ids;
}

auto filter_by_jurisdiction(const Layer &layer,
                            const std::set<int> &jurisdictions) -> Layer {
  layer.require(Column::kJurisdiction, "zoning");
  auto features = std::vector<Feature>();
  std::copy_if(layer.features().begin(), layer.features().end(),
               std::back_inserter(features),
               [&jurisdictions](const Feature &feature) {
                 return feature.jurisdiction.has_value() &&
                        jurisdictions.count(*feature.jurisdiction) != 0;
               });
  return layer.with_features(std::move(features));
}

auto category_codes(const Layer &layer) -> std::set<std::string> {
  auto codes = std::set<std::string>();
  for (const auto &feature : layer.features()) {
    if (feature.category_code.has_value()) {
      codes.insert(*feature.category_code);
    }
  }
  return codes;
}

auto total_bounds(const Layer &layer) -> std::optional<Box> {
  auto bounds = std::optional<Box>();
  for (const auto &feature : layer.features()) {
    if (!feature.geometry.has_value() || bg::is_empty(*feature.geometry)) {
      continue;
    }
    auto envelope = bg::return_envelope<Box>(*feature.geometry);
    if (bounds.has_value()) {
      bg::expand(*bounds, envelope);
    } else {
      bounds = envelope;
    }
  }
  return bounds;
}

}  // namespace zonemap
