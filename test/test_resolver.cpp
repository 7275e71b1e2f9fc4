#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "zonemap/error.hpp"
#include "zonemap/repair.hpp"
#include "zonemap/resolver.hpp"
#include "zonemap/spatial_join.hpp"

namespace zm = zonemap;
using zm::test::parcel;
using zm::test::rectangle;
using zm::test::zone;

namespace {

auto resolve(const zm::Layer &parcels, const zm::Layer &zoning,
             const zm::Config &config = zm::test::nebraska())
    -> zm::ResolvedMapping {
  return zm::resolve_overlaps(zm::spatial_join(parcels, zoning), parcels,
                              zoning, config);
}

auto codes(const zm::ResolvedMapping &mapping)
    -> std::vector<std::optional<std::string>> {
  auto result = std::vector<std::optional<std::string>>();
  for (const auto &row : mapping.rows) {
    result.push_back(row.category_code);
  }
  return result;
}

}  // namespace

TEST_CASE("Resolver - category selection") {
  CHECK(zm::select_category({{"A", 1.0}, {"B", 2.0}}) == "B");
  CHECK(zm::select_category({{"RES", 50.0}, {"COM", 50.0}}) == "COM");
  CHECK(zm::select_category({{"Z", 0.0}, {"M", 0.0}}) == "M");
  CHECK_FALSE(zm::select_category({}).has_value());
}

TEST_CASE("Resolver - three parcels across two districts") {
  auto zoning = zm::test::zoning_layer({
      zone("za", "A", rectangle(0, 0, 10, 10), "Agricultural"),
      zone("zb", "B", rectangle(10, 0, 20, 10), "Business"),
  });
  auto parcels = zm::test::parcel_layer({
      parcel("P1", rectangle(1, 1, 2, 9)),
      parcel("P2", rectangle(15, 1, 19, 9)),
      // 7 of its 10 metres of width lie in A.
      parcel("P3", rectangle(3, 1, 13, 9)),
  });

  auto mapping = resolve(parcels, zoning);

  REQUIRE(mapping.rows.size() == 3);
  CHECK(mapping.rows[0].parcel_id == "P1");
  CHECK(mapping.rows[0].category_code == "A");
  CHECK(mapping.rows[0].category_desc == "Agricultural");
  CHECK(mapping.rows[1].category_code == "B");
  CHECK(mapping.rows[1].category_desc == "Business");
  CHECK(mapping.rows[2].category_code == "A");
  CHECK(mapping.multi_match == 1);
  CHECK(mapping.epsg == parcels.epsg());
  // Parcel geometries are carried over untouched.
  CHECK(bg::equals(*mapping.rows[2].geometry, rectangle(3, 1, 13, 9)));
}

TEST_CASE("Resolver - exact tie") {
  auto zoning = zm::test::zoning_layer({
      zone("z0", "RES", rectangle(-10, -10, 0, 10)),
      zone("z1", "COM", rectangle(0, -10, 10, 10)),
  });
  auto parcels = zm::test::parcel_layer({parcel("P", rectangle(-5, -5, 5, 5))});

  auto first = resolve(parcels, zoning);
  auto second = resolve(parcels, zoning);

  REQUIRE(first.rows.size() == 1);
  CHECK(first.rows[0].category_code == "COM");
  CHECK(codes(first) == codes(second));

  SUBCASE("input order does not matter") {
    auto reversed = zm::test::zoning_layer(
        {zoning.features()[1], zoning.features()[0]});
    CHECK(resolve(parcels, reversed).rows[0].category_code == "COM");
  }
}

TEST_CASE("Resolver - boundary touch only") {
  auto zoning = zm::test::zoning_layer({
      zone("z0", "R2", rectangle(-10, 0, 0, 10)),
      zone("z1", "R1", rectangle(10, 0, 20, 10)),
  });
  auto parcels = zm::test::parcel_layer({parcel("P", rectangle(0, 0, 10, 10))});

  auto mapping = resolve(parcels, zoning);
  REQUIRE(mapping.rows.size() == 1);
  CHECK(mapping.rows[0].category_code == "R1");
}

TEST_CASE("Resolver - totality") {
  auto zoning = zm::test::zoning_layer({
      zone("z0", "R1", rectangle(0, 0, 10, 10)),
      zone("z1", "R1", rectangle(5, 0, 15, 10)),
  });
  auto parcels = zm::test::parcel_layer({
      parcel("in", rectangle(6, 1, 7, 2)),
      parcel("out", rectangle(50, 50, 51, 51)),
      parcel("null", std::nullopt),
      parcel("in", rectangle(60, 60, 61, 61)),
  });

  auto mapping = resolve(parcels, zoning);

  REQUIRE(mapping.rows.size() == 3);
  CHECK(mapping.rows[0].parcel_id == "in");
  // Two polygons of one category are a single match.
  CHECK(mapping.rows[0].category_code == "R1");
  CHECK(mapping.multi_match == 0);
  CHECK(mapping.rows[1].parcel_id == "out");
  CHECK_FALSE(mapping.rows[1].category_code.has_value());
  CHECK(mapping.rows[2].parcel_id == "null");
  CHECK_FALSE(mapping.rows[2].category_code.has_value());
  CHECK_FALSE(mapping.rows[2].geometry.has_value());
}

TEST_CASE("Resolver - same category polygons are merged before measuring") {
  // Two overlapping R1 polygons cover 6 units of the parcel, C1 covers 5.
  auto zoning = zm::test::zoning_layer({
      zone("z0", "R1", rectangle(0, 0, 4, 1)),
      zone("z1", "R1", rectangle(2, 0, 6, 1)),
      zone("z2", "C1", rectangle(6, 0, 11, 1)),
  });
  auto parcels = zm::test::parcel_layer({parcel("P", rectangle(0, 0, 11, 1))});

  auto mapping = resolve(parcels, zoning);
  CHECK(mapping.rows[0].category_code == "R1");

  // Double counting the overlap would not change the answer here, so check
  // a case where it would.
  auto tight = zm::test::zoning_layer({
      zone("z0", "R1", rectangle(0, 0, 4, 1)),
      zone("z1", "R1", rectangle(1, 0, 5, 1)),
      zone("z2", "C1", rectangle(5, 0, 11, 1)),
  });
  CHECK(resolve(parcels, tight).rows[0].category_code == "C1");
}

TEST_CASE("Resolver - enclave inside a self-touching district") {
  // District A loops back through (5 10) around the triangle of B.
  auto zoning = zm::repair_layer(
                    zm::test::zoning_layer({
                        zone("za", "A",
                             zm::test::from_wkt("POLYGON((0 0,0 10,5 10,3 5,"
                                                "7 5,5 10,10 10,10 0,0 0))")),
                        zone("zb", "B",
                             zm::test::from_wkt(
                                 "POLYGON((5 10,7 5,3 5,5 10))")),
                    }))
                    .layer;
  auto parcels =
      zm::test::parcel_layer({parcel("P", rectangle(4.5, 6, 5.5, 7))});

  auto mapping = resolve(parcels, zoning);
  REQUIRE(mapping.rows.size() == 1);
  CHECK(mapping.rows[0].category_code == "B");
  CHECK(mapping.multi_match == 0);
}

TEST_CASE("Resolver - candidates without geometry") {
  auto zoning = zm::test::zoning_layer({
      zone("z0", "B", rectangle(0, 0, 10, 10)),
      zone("z1", "A", std::nullopt),
  });
  auto parcels = zm::test::parcel_layer({parcel("P", rectangle(1, 1, 2, 2))});
  auto candidates = std::vector<zm::CandidateMatch>{
      {0, 0, "P", "B"},
      {0, 1, "P", "A"},
  };

  auto mapping =
      zm::resolve_overlaps(candidates, parcels, zoning, zm::test::nebraska());
  REQUIRE(mapping.rows.size() == 1);
  CHECK(mapping.rows[0].category_code == "B");
}

TEST_CASE("Resolver - parallel and sequential runs agree") {
  auto features = std::vector<zm::Feature>();
  auto zones = std::vector<zm::Feature>();
  for (int ix = 0; ix < 40; ++ix) {
    auto x = 20.0 * ix;
    zones.push_back(zone("w" + std::to_string(ix), "W" + std::to_string(ix),
                         rectangle(x, 0, x + 10, 10)));
    zones.push_back(zone("e" + std::to_string(ix), "E" + std::to_string(ix),
                         rectangle(x + 10, 0, x + 20, 10)));
    // Alternate between a western and an eastern majority.
    auto shift = ix % 2 == 0 ? 2.0 : 8.0;
    features.push_back(parcel(std::to_string(ix),
                              rectangle(x + shift, 1, x + shift + 10, 9)));
  }
  auto parcels = zm::test::parcel_layer(features);
  auto zoning = zm::test::zoning_layer(zones);

  auto sequential = resolve(parcels, zoning);
  auto config = zm::test::nebraska();
  config.num_threads = 4;
  config.min_parallel_size = 0;
  auto parallel = resolve(parcels, zoning, config);

  CHECK(sequential.multi_match == 40);
  CHECK(codes(sequential) == codes(parallel));
  CHECK(sequential.rows[0].category_code == "W0");
  CHECK(sequential.rows[1].category_code == "E1");
}

TEST_CASE("Resolver - contract errors") {
  auto zoning = zm::test::zoning_layer({});
  auto parcels = zm::test::parcel_layer({});

  CHECK_THROWS_AS(zm::resolve_overlaps({}, parcels, zoning, zm::Config{}),
                  zm::ContractError);
  CHECK_THROWS_AS(zm::resolve_overlaps({}, parcels.with_features({}),
                                       zm::Layer({}, {}, 26914),
                                       zm::test::nebraska()),
                  zm::ContractError);
  CHECK(zm::resolve_overlaps({}, parcels, zoning, zm::test::nebraska())
            .rows.empty());
}

TEST_CASE("Resolver - category filter") {
  auto mapping = zm::ResolvedMapping{};
  mapping.epsg = 4326;
  mapping.rows = {
      {"1", "A", std::nullopt, std::nullopt, std::nullopt},
      {"2", "B", std::nullopt, std::nullopt, std::nullopt},
      {"3", std::nullopt, std::nullopt, std::nullopt, std::nullopt},
  };

  auto filtered = zm::filter_by_categories(mapping, {"A"});
  REQUIRE(filtered.rows.size() == 1);
  CHECK(filtered.rows[0].parcel_id == "1");
  CHECK(filtered.epsg == 4326);
}
