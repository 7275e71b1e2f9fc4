#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "fixtures.hpp"
#include "zonemap/shapefile.hpp"

namespace zm = zonemap;
namespace fs = std::filesystem;
using zm::test::rectangle;

namespace {

// Scratch directory removed at the end of the test.
class ScratchDirectory {
 public:
  explicit ScratchDirectory(const std::string &name)
      : path_(fs::temp_directory_path() / name) {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  auto file(const std::string &name) const -> std::string {
    return (path_ / name).string();
  }

 private:
  fs::path path_;
};

auto read_file(const std::string &filename) -> std::string {
  std::ifstream stream(filename);
  std::stringstream buffer;
  buffer << stream.rdbuf();
  return buffer.str();
}

}  // namespace

TEST_CASE("Shapefile - resolved mapping") {
  auto scratch = ScratchDirectory("zonemap_test_mapping");
  auto filename = scratch.file("mapping.shp");

  auto with_hole = zm::test::from_wkt(
      "POLYGON((0 0,0 10,10 10,10 0,0 0),(2 2,8 2,8 8,2 8,2 2))");
  auto mapping = zm::ResolvedMapping{};
  mapping.epsg = 4326;
  mapping.rows = {
      {"P1", "R1", "Residential", 10, with_hole},
      {"P2", std::nullopt, std::nullopt, std::nullopt, std::nullopt},
      {"P3", "C1", std::nullopt, 20, rectangle(20, 0, 30, 5)},
  };
  zm::write_mapping(filename, mapping);

  auto fields = zm::FieldMapping{
      {"parcel_id"}, std::nullopt, {"zone_code"}, {"zone_desc"}, {"juris"}};
  auto layer = zm::read_layer(filename, fields, 4326);

  REQUIRE(layer.size() == 3);
  CHECK(layer.epsg() == 4326);
  CHECK(layer.has_column(zm::Column::kCategoryCode));
  CHECK(layer.has_column(zm::Column::kJurisdiction));

  const auto &first = layer.features()[0];
  CHECK(first.id == "P1");
  CHECK(first.category_code == "R1");
  CHECK(first.category_desc == "Residential");
  CHECK(first.jurisdiction == 10);
  REQUIRE(first.geometry.has_value());
  REQUIRE(first.geometry->size() == 1);
  CHECK(first.geometry->front().inners().size() == 1);
  CHECK(bg::equals(*first.geometry, with_hole));

  const auto &second = layer.features()[1];
  CHECK(second.id == "P2");
  CHECK_FALSE(second.category_code.has_value());
  CHECK_FALSE(second.jurisdiction.has_value());
  CHECK_FALSE(second.geometry.has_value());

  CHECK(layer.features()[2].jurisdiction == 20);
}

TEST_CASE("Shapefile - field mapping") {
  auto scratch = ScratchDirectory("zonemap_test_fields");
  auto filename = scratch.file("dissolved.shp");

  auto dissolved = zm::DissolvedLayer{};
  dissolved.epsg = 4326;
  dissolved.categories = {
      {"AG", "Agricultural", rectangle(0, 0, 1, 1), 3},
  };
  zm::write_dissolved(filename, dissolved);

  SUBCASE("unknown fields are left out of the schema") {
    auto layer = zm::read_layer(filename, zm::FieldMapping::zoning(),
                                std::nullopt);
    REQUIRE(layer.size() == 1);
    CHECK_FALSE(layer.has_column(zm::Column::kCategoryCode));
    CHECK_FALSE(layer.epsg().has_value());
    // No identifier field: row numbers are used.
    CHECK(layer.features()[0].id == "0");
  }

  SUBCASE("parcels fall back on a known column") {
    auto fields = zm::FieldMapping::parcels();
    fields.id_fallback = "zone_label";
    auto layer = zm::read_layer(filename, fields, std::nullopt);
    CHECK(layer.features()[0].id == "AG");
  }
}

TEST_CASE("Shapefile - missing file") {
  CHECK_THROWS_AS(zm::read_layer("/nonexistent/parcels.shp",
                                 zm::FieldMapping::parcels(), std::nullopt),
                  std::runtime_error);
}

TEST_CASE("Shapefile - rollup table") {
  auto scratch = ScratchDirectory("zonemap_test_csv");
  auto filename = scratch.file("rollups.csv");

  auto record = zm::RollupRecord{};
  record.category_code = "R1";
  record.category_desc = "Residential, \"low\" density";
  record.parcel_count = 2;
  record.total_area = 1.5;
  auto unmatched = zm::RollupRecord{};
  unmatched.parcel_count = 1;

  auto config = zm::test::nebraska();
  config.area_unit = "acre";
  zm::write_rollups_csv(filename, {record, unmatched}, config);

  auto text = read_file(filename);
  CHECK(text.find("category_code,category_desc,parcel_count,"
                  "total_area_acre,") == 0);
  CHECK(text.find("\nR1,\"Residential, \"\"low\"\" density\",2,1.500000,") !=
        std::string::npos);
  CHECK(text.find("\n,,1,0.000000,") != std::string::npos);
}

TEST_CASE("Shapefile - zoning lookup table") {
  auto scratch = ScratchDirectory("zonemap_test_lookup");
  auto filename = scratch.file("zoning_lookup.csv");

  SUBCASE("named by zoning code") {
    auto zoning = zm::test::zoning_layer(
        {zm::test::zone("z1", "R-1", rectangle(0, 0, 1, 1), "Residential"),
         zm::test::zone("z2", "C,2", rectangle(1, 0, 2, 1), "Commercial"),
         zm::test::zone("z1", "R-2", rectangle(2, 0, 3, 1), "Residential")});
    zm::write_lookup_csv(filename, zoning);
    CHECK(read_file(filename) ==
          "zoning_id,zoning_name\nz1,R-1\nz2,\"C,2\"\n");
  }

  SUBCASE("named by identifier without a code column") {
    auto zoning = zm::Layer(
        {zm::Feature{"7", std::nullopt, std::nullopt, rectangle(0, 0, 1, 1),
                     std::nullopt}},
        {zm::Column::kId}, 26914);
    zm::write_lookup_csv(filename, zoning);
    CHECK(read_file(filename) == "zoning_id,zoning_name\n7,7\n");
  }
}

TEST_CASE("Shapefile - publish staged outputs") {
  auto scratch = ScratchDirectory("zonemap_test_publish");
  auto destination = fs::path(scratch.file("out"));
  auto staging = destination / ".staging";
  fs::create_directories(staging);

  std::ofstream(destination / "zoning_rollups.csv") << "previous run";
  std::ofstream(destination / "notes.txt") << "kept";
  std::ofstream(staging / "zoning_rollups.csv") << "this run";
  std::ofstream(staging / "zoning_lookup.csv") << "zoning_id,zoning_name\n";

  zm::publish(staging, destination);

  CHECK_FALSE(fs::exists(staging));
  CHECK(read_file((destination / "zoning_rollups.csv").string()) ==
        "this run");
  CHECK(fs::exists(destination / "zoning_lookup.csv"));
  CHECK(read_file((destination / "notes.txt").string()) == "kept");
}
