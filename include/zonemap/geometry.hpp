#pragma once

#include <cmath>

#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace bg = boost::geometry;

namespace zonemap {

/// Planar point. In the canonical geographic reference x holds the longitude
/// and y the latitude, in degrees.
using Point = bg::model::point<double, 2, bg::cs::cartesian>;

/// Geographic point used at the projection boundary.
using GeoPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;

using Box = bg::model::box<Point>;

using Polygon = bg::model::polygon<Point>;

using MultiPolygon = bg::model::multi_polygon<Polygon>;

using Ring = bg::model::ring<Point>;

using Segment = bg::model::segment<Point>;

/// Absolute area of a geometry. Unrepaired input may carry rings with either
/// orientation.
template <typename Geometry>
inline auto absolute_area(const Geometry &geometry) -> double {
  return std::abs(bg::area(geometry));
}

}  // namespace zonemap
