#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "zonemap/config.hpp"
#include "zonemap/pipeline.hpp"
#include "zonemap/quality.hpp"
#include "zonemap/shapefile.hpp"

namespace {

void usage(const char* program) {
  std::cerr << "Usage: " << program
            << " parcels.shp zoning.shp [-o DIR] [--canonical-epsg N] "
               "[--projected-epsg N] [--parcels-epsg N] [--zoning-epsg N] "
               "[--area-unit m2|ha|acre|sqft] [--jurisdictions 10,20] "
               "[--jurisdiction-labels \"10:Bellevue,20:Papillion\"] "
               "[--threads N] [-v]"
            << std::endl;
}

// Names of the selected jurisdictions, for the report title.
auto scope_name(const std::vector<int>& jurisdictions,
                const std::map<int, std::string>& labels) -> std::string {
  auto name = std::string();
  for (auto code : jurisdictions) {
    if (!name.empty()) {
      name += ", ";
    }
    auto it = labels.find(code);
    name += it != labels.end() ? it->second : std::to_string(code);
  }
  return name;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 3) {
    usage(argv[0]);
    return 1;
  }

  std::string parcels_file = argv[1];
  std::string zoning_file = argv[2];

  std::string output_dir = ".";
  std::string area_unit = "m2";
  std::string jurisdictions_text;
  std::string labels_text;
  std::optional<int> parcels_epsg;
  std::optional<int> zoning_epsg;
  auto config = zonemap::Config{};
  config.canonical_epsg = 4326;
  config.projected_epsg = 26914;
  bool verbose = false;

  try {
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      auto has_value = i + 1 < argc;
      if ((arg == "-o" || arg == "-O") && has_value) {
        output_dir = argv[++i];
      } else if (arg == "--canonical-epsg" && has_value) {
        config.canonical_epsg = std::stoi(argv[++i]);
      } else if (arg == "--projected-epsg" && has_value) {
        config.projected_epsg = std::stoi(argv[++i]);
      } else if (arg == "--parcels-epsg" && has_value) {
        parcels_epsg = std::stoi(argv[++i]);
      } else if (arg == "--zoning-epsg" && has_value) {
        zoning_epsg = std::stoi(argv[++i]);
      } else if (arg == "--area-unit" && has_value) {
        area_unit = argv[++i];
      } else if (arg == "--jurisdictions" && has_value) {
        jurisdictions_text = argv[++i];
      } else if (arg == "--jurisdiction-labels" && has_value) {
        labels_text = argv[++i];
      } else if (arg == "--threads" && has_value) {
        config.num_threads = static_cast<size_t>(std::stoul(argv[++i]));
      } else if (arg == "-v") {
        verbose = true;
      } else {
        std::cerr << "Error: Unsupported option " << arg << std::endl;
        usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error& e) {
    // std::stoi reports malformed numbers as invalid_argument/out_of_range
    std::cerr << "Error: invalid numeric argument (" << e.what() << ")"
              << std::endl;
    return 1;
  }

  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  try {
    config.area_unit = area_unit;
    config.area_unit_factor = zonemap::area_unit_factor(area_unit);
    config.validate();

    auto scope = zonemap::Scope{};
    auto title = std::string("parcels");
    if (!jurisdictions_text.empty()) {
      auto codes = zonemap::parse_jurisdictions(jurisdictions_text);
      scope.jurisdictions = std::set<int>(codes.begin(), codes.end());
      auto labels = zonemap::parse_jurisdiction_labels(labels_text);
      title += " (" + scope_name(codes, labels) + ")";
      spdlog::info("scope: {}", scope_name(codes, labels));
    }

    auto parcels = zonemap::read_layer(
        parcels_file, zonemap::FieldMapping::parcels(), parcels_epsg);
    auto zoning = zonemap::read_layer(
        zoning_file, zonemap::FieldMapping::zoning(), zoning_epsg);

    auto quality = zonemap::build_quality_report(parcels);
    auto result = zonemap::run_pipeline(parcels, zoning, config, scope);

    // Outputs land in a staging directory and replace the previous run
    // only once every file is written.
    auto dir = std::filesystem::path(output_dir);
    auto staging = dir / ".zonemap-staging";
    std::filesystem::remove_all(staging);
    std::filesystem::create_directories(staging);
    try {
      zonemap::write_mapping(
          (staging / "parcels_with_zoning_1to1.shp").string(),
          result.mapping);
      zonemap::write_dissolved((staging / "zoning_dissolved.shp").string(),
                               result.dissolved);
      zonemap::write_rollups_csv((staging / "zoning_rollups.csv").string(),
                                 result.rollups, config);
      zonemap::write_lookup_csv((staging / "zoning_lookup.csv").string(),
                                zoning);
      zonemap::write_text(
          (staging / "data_quality_report_parcels.md").string(),
          zonemap::to_markdown(quality, title));
    } catch (const std::exception&) {
      std::error_code ec;
      std::filesystem::remove_all(staging, ec);
      throw;
    }
    zonemap::publish(staging, dir);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
