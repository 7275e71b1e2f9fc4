#pragma once

#include <optional>
#include <string>

#include "zonemap/layer.hpp"

namespace zonemap {

/// @brief Data quality counters of a layer.
struct QualityReport {
  size_t rows{0};
  size_t missing_ids{0};
  /// Rows whose id already appeared in an earlier row.
  size_t duplicate_ids{0};
  size_t geometry_missing{0};
  size_t geometry_valid{0};
  size_t geometry_invalid{0};
  /// geometry_valid / rows, absent for an empty layer.
  std::optional<double> valid_rate;
  /// Total bounds of the geometries, in the layer reference.
  std::optional<Box> bounds;
  std::optional<int> epsg;
};

/// @brief Counts identifiers and geometry validity of a layer.
auto build_quality_report(const Layer &layer) -> QualityReport;

/// @brief Renders a report as a Markdown document.
auto to_markdown(const QualityReport &report, const std::string &title)
    -> std::string;

}  // namespace zonemap
