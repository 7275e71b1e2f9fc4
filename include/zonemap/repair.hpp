#pragma once

#include <optional>
#include <string>
#include <vector>

#include "zonemap/geometry.hpp"
#include "zonemap/layer.hpp"

namespace zonemap {

/// @brief Why a row kept its original geometry.
struct RepairError {
  /// Index of the row in the input layer.
  size_t row;
  /// Description of the failure.
  std::string message;
};

/// @brief Outcome of the repair of one geometry.
struct RepairResult {
  /// The repaired geometry, or the original one if the repair failed.
  MultiPolygon geometry;
  /// Set if the repair failed.
  std::optional<RepairError> error;

  /// Check if the geometry was repaired.
  inline auto ok() const noexcept -> bool { return !error.has_value(); }
};

/// @brief A repaired layer with the rows that could not be repaired.
struct RepairedLayer {
  /// Rows with a non-empty geometry, valid unless listed in fallback_rows.
  Layer layer;
  /// Input row indices that kept their original geometry.
  std::vector<size_t> fallback_rows;
  /// The failures behind fallback_rows.
  std::vector<RepairError> errors;
  /// Number of input rows dropped (null, empty or collapsed geometry).
  size_t dropped{0};
};

/// @brief Rewrites a geometry into a valid equivalent.
///
/// A valid geometry is returned unchanged. Otherwise each ring is noded at
/// its self-intersections and split into simple loops. The loops of a ring
/// are combined with the even-odd rule, so a loop nested in another one of
/// the same ring stays a hole. Holes are subtracted from the shell and the
/// parts of a multi-polygon are unioned together. The number of parts may
/// change: a bowtie becomes two triangles.
///
/// @param[in] geometry The geometry to repair.
/// @return A valid geometry, possibly empty if the input has no area.
/// @throw std::runtime_error if the result is still invalid.
auto make_valid(const MultiPolygon &geometry) -> MultiPolygon;

/// @brief Zero-distance buffer used as a second, idempotent pass.
///
/// Valid and empty geometries are returned unchanged. The buffered geometry
/// is only returned if it is valid, non-empty and has the area of its input;
/// otherwise the input is returned. Geometric failures are logged, not
/// thrown.
auto buffer_zero(const MultiPolygon &geometry) -> MultiPolygon;

/// @brief Repairs one geometry, isolating failures.
///
/// @param[in] geometry The geometry to repair.
/// @param[in] row The index of the row, reported in the error.
auto repair_geometry(const MultiPolygon &geometry, size_t row)
    -> RepairResult;

/// @brief Drops null and empty geometries and repairs the others.
///
/// The input layer is not modified. Rows whose repair fails keep their
/// original geometry and are reported in RepairedLayer::fallback_rows.
auto repair_layer(const Layer &layer) -> RepairedLayer;

}  // namespace zonemap
