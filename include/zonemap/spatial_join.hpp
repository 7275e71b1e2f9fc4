#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "zonemap/layer.hpp"

namespace zonemap {

/// @brief One parcel/zoning pair whose geometries intersect.
struct CandidateMatch {
  /// Row of the parcel in the parcel layer.
  size_t parcel_row;
  /// Row of the zoning polygon in the zoning layer.
  size_t zoning_row;
  std::string parcel_id;
  std::string category_code;
};

/// @brief RTree over the envelopes of the zoning polygons of a layer.
///
/// The index refers to the rows of the layer it was built from, which must
/// outlive it.
class ZoningIndex {
 public:
  /// @brief Pair of a bounding box and a row of the zoning layer.
  using RowIndex = std::pair<Box, size_t>;

  /// @brief RTree index for the envelope of the polygons.
  using RTree =
      boost::geometry::index::rtree<RowIndex,
                                    boost::geometry::index::rstar<16>>;

  /// @brief Bulk loads the index. Rows without a code or a geometry are
  /// skipped.
  explicit ZoningIndex(const Layer &zoning);

  /// Get the number of indexed polygons.
  inline auto size() const noexcept -> size_t { return rtree_->size(); }

  /// @brief Rows whose geometry intersects the given geometry, in ascending
  /// row order.
  auto intersecting(const MultiPolygon &geometry) const -> std::vector<size_t>;

 private:
  const Layer &zoning_;
  std::unique_ptr<RTree> rtree_{};
};

/// @brief Computes the candidate relation between parcels and zoning.
///
/// The predicate is "intersects", so boundary contact counts. The result is
/// ordered by parcel row, then zoning row.
///
/// @param[in] parcels The parcel layer, with an id column.
/// @param[in] zoning The zoning layer, with a category_code column.
/// @throw ContractError if a column is missing or the layers do not share a
/// coordinate reference.
auto spatial_join(const Layer &parcels, const Layer &zoning)
    -> std::vector<CandidateMatch>;

}  // namespace zonemap
