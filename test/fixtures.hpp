#pragma once

#include <optional>
#include <string>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/layer.hpp"

namespace zonemap::test {

/// Easting and northing of the test area in UTM zone 14N (EPSG:26914).
constexpr double kEasting = 500000.0;
constexpr double kNorthing = 4560000.0;

/// Axis aligned rectangle, clockwise and closed.
inline auto rectangle(double x0, double y0, double x1, double y1)
    -> MultiPolygon {
  auto polygon = Polygon();
  bg::append(polygon.outer(), Point(x0, y0));
  bg::append(polygon.outer(), Point(x0, y1));
  bg::append(polygon.outer(), Point(x1, y1));
  bg::append(polygon.outer(), Point(x1, y0));
  bg::append(polygon.outer(), Point(x0, y0));
  return {polygon};
}

/// Rectangle given in metres relative to the test area origin.
inline auto utm_rectangle(double x0, double y0, double x1, double y1)
    -> MultiPolygon {
  return rectangle(kEasting + x0, kNorthing + y0, kEasting + x1,
                   kNorthing + y1);
}

/// Reads a polygon without correcting it.
inline auto from_wkt(const std::string &wkt) -> MultiPolygon {
  auto polygon = Polygon();
  bg::read_wkt(wkt, polygon);
  return {polygon};
}

/// Self-intersecting square whose two triangles have an area of 1 each.
inline auto bowtie() -> MultiPolygon {
  return from_wkt("POLYGON((0 0,2 2,2 0,0 2,0 0))");
}

inline auto parcel(std::string id, std::optional<MultiPolygon> geometry,
                   std::optional<int> jurisdiction = std::nullopt)
    -> Feature {
  return {std::move(id), std::nullopt, std::nullopt, std::move(geometry),
          jurisdiction};
}

inline auto zone(std::string id, std::optional<std::string> code,
                 std::optional<MultiPolygon> geometry,
                 std::optional<std::string> description = std::nullopt,
                 std::optional<int> jurisdiction = std::nullopt) -> Feature {
  return {std::move(id), std::move(code), std::move(description),
          std::move(geometry), jurisdiction};
}

inline auto parcel_layer(std::vector<Feature> features,
                         std::optional<int> epsg = 26914) -> Layer {
  return {std::move(features), {Column::kId}, epsg};
}

inline auto zoning_layer(std::vector<Feature> features,
                         std::optional<int> epsg = 26914) -> Layer {
  return {std::move(features),
          {Column::kId, Column::kCategoryCode, Column::kCategoryDesc,
           Column::kJurisdiction},
          epsg};
}

/// Eastern Nebraska: WGS 84 and UTM zone 14N, areas in square metres.
inline auto nebraska() -> Config {
  auto config = Config{};
  config.canonical_epsg = 4326;
  config.projected_epsg = 26914;
  config.area_unit_factor = 1.0;
  return config;
}

}  // namespace zonemap::test
