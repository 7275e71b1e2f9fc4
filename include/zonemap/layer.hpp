#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "zonemap/geometry.hpp"

namespace zonemap {

/// @brief Attribute columns a layer may carry besides its geometry.
enum class Column { kId, kCategoryCode, kCategoryDesc, kJurisdiction };

/// Get the column name used in messages and output tables.
auto to_string(Column column) -> std::string;

/// @brief One real-world polygon record.
struct Feature {
  /// Stable identifier.
  std::string id;

  /// Classification code, e.g. the zoning class.
  std::optional<std::string> category_code;

  /// Human readable label of the classification.
  std::optional<std::string> category_desc;

  /// Geometry. An empty optional is a null geometry.
  std::optional<MultiPolygon> geometry;

  /// Grouping key, e.g. the municipality.
  std::optional<int> jurisdiction;
};

/// @brief A table of features sharing a schema and a coordinate reference.
class Layer {
 public:
  /// @brief Constructs an empty layer without columns or reference.
  Layer() = default;

  /// @brief Constructs a layer.
  ///
  /// @param[in] features The rows of the layer.
  /// @param[in] columns The attribute columns present in the source.
  /// @param[in] epsg The EPSG code of the geometries, if known.
  Layer(std::vector<Feature> features, std::set<Column> columns,
        std::optional<int> epsg)
      : features_(std::move(features)),
        columns_(std::move(columns)),
        epsg_(epsg) {}

  /// Check if the layer has no rows.
  inline auto empty() const noexcept -> bool { return features_.empty(); }

  /// Get the number of rows.
  inline auto size() const noexcept -> size_t { return features_.size(); }

  /// Get the rows.
  constexpr auto features() const noexcept -> const std::vector<Feature> & {
    return features_;
  }

  constexpr auto features() noexcept -> std::vector<Feature> & {
    return features_;
  }

  /// Get the attribute columns present in the layer.
  constexpr auto columns() const noexcept -> const std::set<Column> & {
    return columns_;
  }

  /// Check if the layer carries the column.
  inline auto has_column(Column column) const -> bool {
    return columns_.count(column) != 0;
  }

  /// Get the EPSG code of the geometries.
  constexpr auto epsg() const noexcept -> const std::optional<int> & {
    return epsg_;
  }

  /// @brief Ensures the layer carries a column.
  ///
  /// @param[in] column The required column.
  /// @param[in] context The name of the layer, used in the message.
  /// @throw ContractError if the column is absent.
  auto require(Column column, const std::string &context) const -> void;

  /// @brief Returns a copy with the same schema and reference but other rows.
  auto with_features(std::vector<Feature> features) const -> Layer {
    return {std::move(features), columns_, epsg_};
  }

  /// @brief Returns a copy carrying the given reference, without touching
  /// the coordinates.
  auto with_epsg(int epsg) const -> Layer {
    return {features_, columns_, epsg};
  }

 private:
  std::vector<Feature> features_{};
  std::set<Column> columns_{};
  std::optional<int> epsg_{};
};

/// @brief Locates the identifier column of a source table.
///
/// @param[in] columns The column names of the source.
/// @param[in] candidates The accepted names, in priority order.
/// @param[in] fallback The column to use when no candidate is present.
/// @return The first candidate present, otherwise the fallback if present,
/// otherwise nothing (the caller then synthesizes identifiers).
auto resolve_id_column(const std::vector<std::string> &columns,
                       const std::vector<std::string> &candidates,
                       const std::optional<std::string> &fallback)
    -> std::optional<std::string>;

/// @brief Sequential identifiers "0", "1", ... for a table without an
/// identifier column.
auto synthesize_ids(size_t count) -> std::vector<std::string>;

/// @brief Keeps the rows whose jurisdiction is one of the given codes.
/// @throw ContractError if the layer has no jurisdiction column.
auto filter_by_jurisdiction(const Layer &layer,
                            const std::set<int> &jurisdictions) -> Layer;

/// @brief Distinct non-null category codes of a layer.
auto category_codes(const Layer &layer) -> std::set<std::string>;

/// @brief Total bounds of the non-null geometries, if any.
auto total_bounds(const Layer &layer) -> std::optional<Box>;

}  // namespace zonemap
