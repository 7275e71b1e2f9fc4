#pragma once

#include <vector>

#include "zonemap/geometry.hpp"

namespace zonemap {

/// @brief Unions a set of geometries, merging the smallest pairs first.
///
/// Inputs must be valid. Boost.Geometry exceptions raised by the overlay are
/// propagated.
///
/// @param[in] geometries The geometries to merge.
/// @return The union, empty if there is no input.
auto cascade_union(std::vector<MultiPolygon> geometries) -> MultiPolygon;

/// @brief Combines geometries with the even-odd rule: a point belongs to the
/// result if it lies inside an odd number of inputs.
///
/// Used for the loops cut from one ring, where a loop nested inside another
/// encloses a hole.
auto even_odd_union(const std::vector<MultiPolygon> &geometries)
    -> MultiPolygon;

/// @brief Area of the intersection of two valid geometries.
auto intersection_area(const MultiPolygon &lhs, const MultiPolygon &rhs)
    -> double;

}  // namespace zonemap
