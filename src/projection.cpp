#include "zonemap/projection.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "zonemap/error.hpp"

namespace zonemap {

namespace {

// Builds the projection of an EPSG code, translating the Boost exception for
// unknown codes into a contract violation.
auto make_projection(int epsg) -> bg::srs::projection<> {
  try {
    return bg::srs::projection<>(bg::srs::epsg(epsg));
  } catch (const bg::projection_exception &ex) {
    throw ContractError("unsupported EPSG code " + std::to_string(epsg) +
                        ": " + ex.what());
  }
}

}  // namespace

Reprojector::Reprojector(int from_epsg, int to_epsg, int canonical_epsg)
    : from_epsg_(from_epsg), to_epsg_(to_epsg) {
  if (is_identity()) {
    return;
  }
  if (from_epsg != canonical_epsg) {
    source_.emplace(make_projection(from_epsg));
  }
  if (to_epsg != canonical_epsg) {
    target_.emplace(make_projection(to_epsg));
  }
}

auto Reprojector::operator()(const Point &point) const -> Point {
  if (is_identity()) {
    return point;
  }
  auto geographic = GeoPoint(point.get<0>(), point.get<1>());
  if (source_.has_value() && !source_->inverse(point, geographic)) {
    throw std::runtime_error("cannot unproject point from EPSG:" +
                             std::to_string(from_epsg_));
  }
  if (!target_.has_value()) {
    return {geographic.get<0>(), geographic.get<1>()};
  }
  auto projected = Point();
  if (!target_->forward(geographic, projected)) {
    throw std::runtime_error("cannot project point to EPSG:" +
                             std::to_string(to_epsg_));
  }
  return projected;
}

auto Reprojector::operator()(const MultiPolygon &geometry) const
    -> MultiPolygon {
  auto result = geometry;
  if (is_identity()) {
    return result;
  }
  bg::for_each_point(result, [this](Point &point) { point = (*this)(point); });
  return result;
}

auto ensure_crs(const Layer &layer, const Config &config) -> Layer {
  if (!layer.epsg().has_value()) {
    spdlog::debug("layer has no reference; tagging it as EPSG:{}",
                  config.canonical_epsg);
    return layer.with_epsg(config.canonical_epsg);
  }
  return to_crs(layer, config.canonical_epsg, config);
}

auto to_crs(const Layer &layer, int epsg, const Config &config) -> Layer {
  if (!layer.epsg().has_value()) {
    throw ContractError("layer has no coordinate reference");
  }
  auto reproject = Reprojector(*layer.epsg(), epsg, config.canonical_epsg);
  if (reproject.is_identity()) {
    return layer;
  }
  auto features = layer.features();
  for (auto &feature : features) {
    if (feature.geometry.has_value()) {
      feature.geometry = reproject(*feature.geometry);
    }
  }
  return Layer(std::move(features), layer.columns(), epsg);
}

}  // namespace zonemap
