#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace zonemap {

/// Square metres in one international acre (exact by definition).
constexpr double kSquareMetersPerAcre = 4046.8564224;

/// Square metres in one hectare.
constexpr double kSquareMetersPerHectare = 10000.0;

/// Square metres in one international square foot (0.3048 m squared).
constexpr double kSquareMetersPerSquareFoot = 0.09290304;

/// @brief Deployment constants handed to every entry point of the core.
///
/// The EPSG codes and the area conversion are region specific and must be
/// supplied by the caller: a default constructed configuration does not
/// validate.
struct Config {
  /// EPSG code of the canonical geographic reference (longitude/latitude in
  /// degrees), e.g. 4326.
  int canonical_epsg{0};

  /// EPSG code of the locally accurate projected reference used for areas
  /// and unions, e.g. 26914 (UTM zone 14N) for eastern Nebraska.
  int projected_epsg{0};

  /// Factor converting square units of the projected reference into the
  /// display unit. 1.0 keeps square metres.
  double area_unit_factor{0.0};

  /// Name of the display unit, used in reports.
  std::string area_unit{"m2"};

  /// Number of threads for the resolver area step. 0 uses all CPUs.
  size_t num_threads{1};

  /// Below this number of multi-match parcels the area step runs
  /// sequentially.
  size_t min_parallel_size{64};

  /// @brief Check the configuration.
  /// @throw ContractError if a code or the unit factor is not usable.
  auto validate() const -> void;
};

/// @brief Returns the factor converting square metres into the named unit.
///
/// @param[in] unit One of "m2", "ha", "acre" or "sqft".
/// @throw ContractError for an unknown unit.
auto area_unit_factor(const std::string &unit) -> double;

/// @brief Parses jurisdiction display labels.
///
/// The format is a comma separated list of "code:label" pairs, e.g.
/// "10:Bellevue,20:Papillion". Malformed entries are skipped.
auto parse_jurisdiction_labels(const std::string &text)
    -> std::map<int, std::string>;

/// @brief Parses a comma separated list of jurisdiction codes.
/// @throw ContractError if an entry is not an integer.
auto parse_jurisdictions(const std::string &text) -> std::vector<int>;

}  // namespace zonemap
