#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "zonemap/error.hpp"
#include "zonemap/layer.hpp"

namespace zm = zonemap;
using zm::test::parcel;
using zm::test::rectangle;
using zm::test::zone;

TEST_CASE("Layer - identifier column resolution") {
  const auto candidates =
      std::vector<std::string>{"parcel_id", "parid", "pin"};

  SUBCASE("first candidate present wins") {
    auto column = zm::resolve_id_column({"objectid", "pin", "parid"},
                                        candidates, "objectid");
    REQUIRE(column.has_value());
    CHECK(*column == "parid");
  }

  SUBCASE("fallback when no candidate is present") {
    auto column =
        zm::resolve_id_column({"objectid", "area"}, candidates, "objectid");
    REQUIRE(column.has_value());
    CHECK(*column == "objectid");
  }

  SUBCASE("nothing when the fallback is absent too") {
    CHECK_FALSE(
        zm::resolve_id_column({"area"}, candidates, "objectid").has_value());
    CHECK_FALSE(
        zm::resolve_id_column({"area"}, candidates, std::nullopt).has_value());
  }
}

TEST_CASE("Layer - synthesized identifiers") {
  CHECK(zm::synthesize_ids(3) == std::vector<std::string>{"0", "1", "2"});
  CHECK(zm::synthesize_ids(0).empty());
}

TEST_CASE("Layer - required columns") {
  auto layer = zm::test::parcel_layer({parcel("1", rectangle(0, 0, 1, 1))});
  CHECK_NOTHROW(layer.require(zm::Column::kId, "parcel"));
  CHECK_THROWS_WITH_AS(
      layer.require(zm::Column::kCategoryCode, "zoning"),
      "zoning layer is missing required column 'category_code'",
      zm::ContractError);
}

TEST_CASE("Layer - jurisdiction filter") {
  auto zoning = zm::test::zoning_layer({
      zone("a", "R1", rectangle(0, 0, 1, 1), std::nullopt, 10),
      zone("b", "R2", rectangle(1, 0, 2, 1), std::nullopt, 20),
      zone("c", "R3", rectangle(2, 0, 3, 1), std::nullopt, std::nullopt),
  });

  auto filtered = zm::filter_by_jurisdiction(zoning, {10});
  REQUIRE(filtered.size() == 1);
  CHECK(filtered.features()[0].id == "a");
  CHECK(filtered.epsg() == zoning.epsg());
  CHECK(filtered.columns() == zoning.columns());

  auto parcels = zm::test::parcel_layer({});
  CHECK_THROWS_AS(zm::filter_by_jurisdiction(parcels, {10}),
                  zm::ContractError);
}

TEST_CASE("Layer - codes and bounds") {
  auto zoning = zm::test::zoning_layer({
      zone("a", "R1", rectangle(0, 0, 1, 1)),
      zone("b", "C1", rectangle(4, -2, 5, 3)),
      zone("c", std::nullopt, std::nullopt),
      zone("d", "R1", rectangle(1, 0, 2, 1)),
  });

  CHECK(zm::category_codes(zoning) == std::set<std::string>{"C1", "R1"});

  auto bounds = zm::total_bounds(zoning);
  REQUIRE(bounds.has_value());
  CHECK(bounds->min_corner().get<0>() == 0.0);
  CHECK(bounds->min_corner().get<1>() == -2.0);
  CHECK(bounds->max_corner().get<0>() == 5.0);
  CHECK(bounds->max_corner().get<1>() == 3.0);

  CHECK_FALSE(zm::total_bounds(zm::test::parcel_layer({})).has_value());
}
