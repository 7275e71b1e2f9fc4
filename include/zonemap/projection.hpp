#pragma once

#include <optional>

// Boost 1.74 dpar.hpp uses boost::get on a variant without including it.
#include <boost/variant/get.hpp>
#include <boost/geometry/srs/epsg.hpp>
#include <boost/geometry/srs/projection.hpp>

#include "zonemap/config.hpp"
#include "zonemap/geometry.hpp"
#include "zonemap/layer.hpp"

namespace zonemap {

/// @brief Converts coordinates between two EPSG references.
///
/// The canonical code of the configuration is handled as longitude/latitude
/// degrees stored in cartesian points. Any other code is resolved through
/// the Boost.Geometry EPSG table and must describe a projected reference.
/// Converting between two projected references goes through geographic
/// coordinates.
class Reprojector {
 public:
  /// @brief Constructs a reprojector.
  ///
  /// @param[in] from_epsg The reference of the input coordinates.
  /// @param[in] to_epsg The reference of the output coordinates.
  /// @param[in] canonical_epsg The geographic reference code.
  /// @throw ContractError if a code is unknown.
  Reprojector(int from_epsg, int to_epsg, int canonical_epsg);

  /// Check if the conversion leaves coordinates untouched.
  inline auto is_identity() const noexcept -> bool {
    return from_epsg_ == to_epsg_;
  }

  /// @brief Converts one point.
  /// @throw std::runtime_error if the point cannot be projected.
  auto operator()(const Point &point) const -> Point;

  /// @brief Converts every vertex of a geometry.
  /// @throw std::runtime_error if a vertex cannot be projected.
  auto operator()(const MultiPolygon &geometry) const -> MultiPolygon;

 private:
  using Projection = bg::srs::projection<>;

  int from_epsg_;
  int to_epsg_;

  /// Projection of the source reference, absent when it is geographic.
  std::optional<Projection> source_{};

  /// Projection of the target reference, absent when it is geographic.
  std::optional<Projection> target_{};
};

/// @brief Brings a layer into the canonical reference.
///
/// A layer without a reference is tagged as canonical without touching its
/// coordinates; a layer in another reference is reprojected.
auto ensure_crs(const Layer &layer, const Config &config) -> Layer;

/// @brief Reprojects a layer into the given reference.
/// @throw ContractError if the layer has no reference.
auto to_crs(const Layer &layer, int epsg, const Config &config) -> Layer;

}  // namespace zonemap
