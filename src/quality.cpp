#include "zonemap/quality.hpp"

#include <set>

#include <spdlog/fmt/fmt.h>

namespace zonemap {

auto build_quality_report(const Layer &layer) -> QualityReport {
  auto report = QualityReport{};
  report.rows = layer.size();
  report.epsg = layer.epsg();
  report.bounds = total_bounds(layer);

  auto seen = std::set<std::string>();
  for (const auto &feature : layer.features()) {
    if (feature.id.empty()) {
      ++report.missing_ids;
    } else if (!seen.insert(feature.id).second) {
      ++report.duplicate_ids;
    }

    if (!feature.geometry.has_value() || bg::is_empty(*feature.geometry)) {
      ++report.geometry_missing;
    } else if (bg::is_valid(*feature.geometry)) {
      ++report.geometry_valid;
    } else {
      ++report.geometry_invalid;
    }
  }

  if (report.rows != 0) {
    report.valid_rate = static_cast<double>(report.geometry_valid) /
                        static_cast<double>(report.rows);
  }
  return report;
}

auto to_markdown(const QualityReport &report, const std::string &title)
    -> std::string {
  auto text = fmt::format("# Data Quality Report: {}\n\n", title);
  text += fmt::format("- Rows: **{}**\n", report.rows);
  text += fmt::format(
      "- CRS: **{}**\n",
      report.epsg.has_value() ? fmt::format("EPSG:{}", *report.epsg) : "none");
  if (report.bounds.has_value()) {
    const auto &min = report.bounds->min_corner();
    const auto &max = report.bounds->max_corner();
    text += fmt::format("- BBox: **[{}, {}, {}, {}]**\n", min.get<0>(),
                        min.get<1>(), max.get<0>(), max.get<1>());
  }
  text += fmt::format("- id missing: **{}**\n", report.missing_ids);
  text += fmt::format("- id duplicates: **{}**\n", report.duplicate_ids);
  text += fmt::format("- geometry missing: **{}**\n", report.geometry_missing);
  text += fmt::format("- geometry valid: **{}**\n", report.geometry_valid);
  text += fmt::format("- geometry invalid: **{}**\n", report.geometry_invalid);
  if (report.valid_rate.has_value()) {
    text += fmt::format("- geometry valid rate: **{:.4f}**\n",
                        *report.valid_rate);
  }
  return text;
}

}  // namespace zonemap
