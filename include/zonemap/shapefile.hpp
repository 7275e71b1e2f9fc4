#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/dissolve.hpp"
#include "zonemap/layer.hpp"
#include "zonemap/resolver.hpp"
#include "zonemap/rollup.hpp"

namespace zonemap {

/// @brief DBF columns feeding the attributes of a layer.
///
/// Each list holds the accepted field names in priority order; names are
/// compared lower-cased. An attribute whose candidates are all absent is
/// not part of the layer schema.
struct FieldMapping {
  std::vector<std::string> id_candidates;
  std::optional<std::string> id_fallback;
  std::vector<std::string> category_candidates;
  std::vector<std::string> description_candidates;
  std::vector<std::string> jurisdiction_candidates;

  /// Fields of the county tax parcel export.
  static auto parcels() -> FieldMapping;

  /// Fields of the county zoning export.
  static auto zoning() -> FieldMapping;
};

/// @brief Loads a polygon shapefile into a layer.
///
/// Clockwise parts start a new polygon and counter-clockwise parts are holes
/// of the current one. Records without vertices become null geometries.
/// Without an identifier field, sequential identifiers are synthesized.
///
/// @param[in] filename The filename of the shapefile.
/// @param[in] fields The attribute mapping.
/// @param[in] epsg The reference of the coordinates, if known.
/// @throw std::runtime_error if the file cannot be read.
auto read_layer(const std::string &filename, const FieldMapping &fields,
                const std::optional<int> &epsg) -> Layer;

/// @brief Saves the resolved mapping as a polygon shapefile.
/// @throw std::runtime_error if the file cannot be written.
auto write_mapping(const std::string &filename, const ResolvedMapping &mapping)
    -> void;

/// @brief Saves the dissolved categories as a polygon shapefile.
/// @throw std::runtime_error if the file cannot be written.
auto write_dissolved(const std::string &filename,
                     const DissolvedLayer &dissolved) -> void;

/// @brief Saves the rollups as a CSV table.
/// @throw std::runtime_error if the file cannot be written.
auto write_rollups_csv(const std::string &filename,
                       const std::vector<RollupRecord> &rollups,
                       const Config &config) -> void;

/// @brief Saves the zoning lookup table as CSV.
///
/// One `zoning_id,zoning_name` row per distinct identifier, in input order.
/// The name is the zoning code of the first row carrying the identifier,
/// or the identifier itself when the layer has no code.
/// @throw std::runtime_error if the file cannot be written.
auto write_lookup_csv(const std::string &filename, const Layer &zoning)
    -> void;

/// @brief Saves a text document.
/// @throw std::runtime_error if the file cannot be written.
auto write_text(const std::string &filename, const std::string &text) -> void;

/// @brief Moves the files of a staging directory into their destination.
///
/// Files of the same name in the destination are replaced. The staging
/// directory is removed once empty.
///
/// @param[in] staging The directory holding the finished outputs.
/// @param[in] destination The output directory.
/// @throw std::filesystem::filesystem_error if a file cannot be moved.
auto publish(const std::filesystem::path &staging,
             const std::filesystem::path &destination) -> void;

}  // namespace zonemap
