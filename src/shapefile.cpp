#include "zonemap/shapefile.hpp"

#include <shapefil.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace zonemap {

namespace {

// The SHPObjectPtr type is a unique_ptr for SHPObject with a custom
// deleter that calls SHPDestroyObject.
using SHPObjectPtr = std::unique_ptr<SHPObject, decltype(&SHPDestroyObject)>;

// Width of the DBF text columns written by this module.
constexpr int kCodeWidth = 64;
constexpr int kTextWidth = 254;

// Creates a new shapefile with the specified arguments.
//
// This function is a wrapper around the SHPCreateLL function from the
// shapelib library. When the shapefile is created, the function checks if the
// handle is null and throws a runtime error if it is.
template <typename... Args>
auto shp_create(const std::string &filename, Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  auto handle = SHPCreateLL(filename.c_str(), args..., &sHooks);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create shapefile: '" + filename + "'");
  }
  SHPClose(handle);
}

// Opens an existing shapefile with the specified arguments.
//
// The result is returned as a unique_ptr with a custom deleter that calls
// SHPClose. The function throws a runtime error naming the file if the
// handle is null.
template <typename... Args>
auto shp_open(const std::string &filename, Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  auto handle = std::unique_ptr<SHPInfo, decltype(&SHPClose)>(
      SHPOpenLL(filename.c_str(), args..., &sHooks), SHPClose);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to open shapefile: '" + filename + "'");
  }
  return handle;
}

// Creates a new dbf file beside the shapefile.
template <typename... Args>
auto dbf_create(const std::string &filename, Args... args) {
  auto handle = DBFCreate(filename.c_str(), args...);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create dbf file: '" + filename + "'");
  }
  DBFClose(handle);
}

// Opens an existing dbf file, returned as a unique_ptr with a custom deleter
// that calls DBFClose.
template <typename... Args>
auto dbf_open(const std::string &filename, Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  auto handle = std::unique_ptr<DBFInfo, decltype(&DBFClose)>(
      DBFOpenLL(filename.c_str(), args..., &sHooks), DBFClose);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to open dbf file: '" + filename + "'");
  }
  return handle;
}

// Creates a shape object and wraps it into a SHPObjectPtr.
template <typename Function, typename... Args>
auto shp_create_object(Function function, Args... args) {
  auto handle = function(args...);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create shapefile object");
  }
  return SHPObjectPtr(handle, SHPDestroyObject);
}

// Reads a shape object, wrapped into a SHPObjectPtr.
auto shp_read_object(SHPHandle handle, int index) {
  auto shape = SHPReadObject(handle, index);
  if (shape == nullptr) {
    throw std::runtime_error("Failed to read shape " + std::to_string(index));
  }
  return SHPObjectPtr(shape, SHPDestroyObject);
}

auto lower(std::string text) -> std::string {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

auto trim(const std::string &text) -> std::string {
  auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

// Description of a DBF column.
struct DbfField {
  int index;
  DBFFieldType type;
  int decimals;
};

// The columns of a dbf file, keyed by lower-cased name.
class DbfSchema {
 public:
  explicit DbfSchema(DBFHandle handle) {
    auto count = DBFGetFieldCount(handle);
    for (int ix = 0; ix < count; ++ix) {
      // 11 characters and the terminator
      std::array<char, 12> name{};
      int width = 0;
      int decimals = 0;
      auto type = DBFGetFieldInfo(handle, ix, name.data(), &width, &decimals);
      names_.push_back(lower(name.data()));
      fields_.push_back({ix, type, decimals});
    }
  }

  // Get the first candidate present in the file.
  auto find(const std::vector<std::string> &candidates,
            const std::optional<std::string> &fallback = std::nullopt) const
      -> std::optional<DbfField> {
    auto name = resolve_id_column(names_, candidates, fallback);
    if (!name.has_value()) {
      return std::nullopt;
    }
    auto it = std::find(names_.begin(), names_.end(), *name);
    return fields_[static_cast<size_t>(it - names_.begin())];
  }

 private:
  std::vector<std::string> names_;
  std::vector<DbfField> fields_;
};

// Reads a value as text. Integral numbers are written without decimals.
auto read_text(DBFHandle handle, int row, const DbfField &field)
    -> std::optional<std::string> {
  if (DBFIsAttributeNULL(handle, row, field.index)) {
    return std::nullopt;
  }
  if ((field.type == FTInteger || field.type == FTDouble) &&
      field.decimals == 0) {
    auto value = DBFReadDoubleAttribute(handle, row, field.index);
    return std::to_string(static_cast<long long>(std::llround(value)));
  }
  auto text = trim(DBFReadStringAttribute(handle, row, field.index));
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

auto read_integer(DBFHandle handle, int row, const DbfField &field)
    -> std::optional<int> {
  auto text = read_text(handle, row, field);
  if (!text.has_value()) {
    return std::nullopt;
  }
  char *end = nullptr;
  auto value = std::strtod(text->c_str(), &end);
  if (end == text->c_str() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return static_cast<int>(std::lround(value));
}

// Extracts the rings of a shape and assembles them into polygons.
//
// @param[in] shape The shape to read.
// @return The geometry, or nothing for a shape without vertices.
auto read_geometry(SHPObjectPtr &shape) -> std::optional<MultiPolygon> {
  if (shape->nVertices == 0 || shape->nParts == 0) {
    return std::nullopt;
  }
  const auto *x = shape->padfX;
  const auto *y = shape->padfY;

  auto geometry = MultiPolygon();

  // shapelib is a C library, so we need to use a raw pointer arithmetic here
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int lx = 0; lx < shape->nParts; ++lx) {
    int end = (lx == shape->nParts - 1) ? shape->nVertices
                                        : shape->panPartStart[lx + 1];
    auto ring = Ring();
    ring.reserve(end - shape->panPartStart[lx]);
    for (int jx = shape->panPartStart[lx]; jx < end; ++jx) {
      boost::geometry::append(ring, Point(x[jx], y[jx]));
    }
    // Outer rings are clockwise, which Boost measures as a positive area.
    if (geometry.empty() || bg::area(ring) >= 0) {
      auto polygon = Polygon();
      polygon.outer() = std::move(ring);
      geometry.push_back(std::move(polygon));
    } else {
      geometry.back().inners().push_back(std::move(ring));
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  return geometry;
}

// Builds the shape of a geometry: one part per ring.
auto make_shape(const std::optional<MultiPolygon> &geometry) -> SHPObjectPtr {
  if (!geometry.has_value() || bg::is_empty(*geometry)) {
    return shp_create_object(SHPCreateSimpleObject, SHPT_NULL, 0, nullptr,
                             nullptr, nullptr);
  }
  auto x = std::vector<double>();
  auto y = std::vector<double>();
  auto pan_starts = std::vector<int>();
  auto pan_types = std::vector<int>();
  auto append_ring = [&](const Ring &ring) {
    pan_starts.push_back(static_cast<int>(x.size()));
    pan_types.push_back(SHPP_RING);
    for (const auto &point : ring) {
      x.push_back(point.get<0>());
      y.push_back(point.get<1>());
    }
  };
  for (const auto &polygon : *geometry) {
    append_ring(polygon.outer());
    for (const auto &inner : polygon.inners()) {
      append_ring(inner);
    }
  }
  return shp_create_object(SHPCreateObject, SHPT_POLYGON, -1,
                           static_cast<int>(pan_starts.size()),
                           pan_starts.data(), pan_types.data(),
                           static_cast<int>(x.size()), x.data(), y.data(),
                           nullptr, nullptr);
}

// A DBF column to create.
struct DbfColumn {
  const char *name;
  DBFFieldType type;
  int width;
};

constexpr int kIntegerWidth = 10;

// Writes the shapes and attributes of a table. The attribute writer receives
// the dbf handle, the record index and the row.
template <typename Row, typename Geometry, typename Attributes>
void write_table(const std::string &filename,
                 const std::vector<DbfColumn> &fields,
                 const std::vector<Row> &rows, Geometry geometry_of,
                 Attributes write_attributes) {
  shp_create(filename, SHPT_POLYGON);
  dbf_create(filename);
  auto handle = shp_open(filename, "rb+");
  auto dbf_handle = dbf_open(filename, "rb+");

  for (const auto &field : fields) {
    if (DBFAddField(dbf_handle.get(), field.name, field.type, field.width,
                    0) == -1) {
      throw std::runtime_error("Failed to add field '" +
                               std::string(field.name) + "' to '" + filename +
                               "'");
    }
  }

  for (const auto &row : rows) {
    auto obj = make_shape(geometry_of(row));
    auto shape_id = SHPWriteObject(handle.get(), -1, obj.get());
    if (shape_id == -1) {
      throw std::runtime_error("Failed to write shapefile object to '" +
                               filename + "'");
    }
    write_attributes(dbf_handle.get(), shape_id, row);
  }
}

void check_write(int status, const std::string &what) {
  if (status == 0) {
    throw std::runtime_error("Failed to write attribute " + what);
  }
}

void write_string(DBFHandle handle, int row, int field,
                  const std::optional<std::string> &value, size_t width) {
  if (!value.has_value()) {
    check_write(DBFWriteNULLAttribute(handle, row, field), "null");
    return;
  }
  check_write(DBFWriteStringAttribute(handle, row, field,
                                      value->substr(0, width).c_str()),
              *value);
}

// Quotes a CSV field if needed.
auto csv_field(const std::optional<std::string> &value) -> std::string {
  if (!value.has_value()) {
    return {};
  }
  if (value->find_first_of(",\"\n") == std::string::npos) {
    return *value;
  }
  auto quoted = std::string("\"");
  for (auto c : *value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  return quoted + '"';
}

}  // namespace

auto FieldMapping::parcels() -> FieldMapping {
  return {{"parcel_id", "parid", "par_id", "pin", "parcelno", "parcel_no"},
          "objectid",
          {},
          {},
          {"jurisdiction"}};
}

auto FieldMapping::zoning() -> FieldMapping {
  return {{"zoning_id", "objectid"},
          std::nullopt,
          {"zoning_code", "zoneclass"},
          {"zoning_desc", "zonedesc"},
          {"jurisdiction"}};
}

auto read_layer(const std::string &filename, const FieldMapping &fields,
                const std::optional<int> &epsg) -> Layer {
  auto handle = shp_open(filename, "rb");
  auto dbf_handle = dbf_open(filename, "rb");

  int shape_types = 0;
  int entities = 0;
  std::array<double, 4> min_bound{};
  std::array<double, 4> max_bound{};
  SHPGetInfo(handle.get(), &entities, &shape_types, min_bound.data(),
             max_bound.data());
  if (shape_types != SHPT_POLYGON && shape_types != SHPT_POLYGONZ &&
      shape_types != SHPT_POLYGONM) {
    throw std::runtime_error("'" + filename + "' is not a polygon shapefile");
  }
  if (DBFGetRecordCount(dbf_handle.get()) != entities) {
    throw std::runtime_error("'" + filename +
                             "': shape and attribute counts differ");
  }

  auto schema = DbfSchema(dbf_handle.get());
  auto id_field = schema.find(fields.id_candidates, fields.id_fallback);
  auto category_field = schema.find(fields.category_candidates);
  auto description_field = schema.find(fields.description_candidates);
  auto jurisdiction_field = schema.find(fields.jurisdiction_candidates);

  auto columns = std::set<Column>{Column::kId};
  if (category_field.has_value()) {
    columns.insert(Column::kCategoryCode);
  }
  if (description_field.has_value()) {
    columns.insert(Column::kCategoryDesc);
  }
  if (jurisdiction_field.has_value()) {
    columns.insert(Column::kJurisdiction);
  }
  if (!id_field.has_value()) {
    spdlog::warn("'{}': no identifier field, using row numbers", filename);
  }

  auto synthesized = synthesize_ids(static_cast<size_t>(entities));
  auto features = std::vector<Feature>();
  features.reserve(static_cast<size_t>(entities));
  auto *dbf = dbf_handle.get();
  for (int ix = 0; ix < entities; ++ix) {
    auto shape = shp_read_object(handle.get(), ix);
    auto feature = Feature{};
    feature.geometry = read_geometry(shape);
    if (id_field.has_value()) {
      feature.id = read_text(dbf, ix, *id_field).value_or("");
    } else {
      feature.id = synthesized[static_cast<size_t>(ix)];
    }
    if (category_field.has_value()) {
      feature.category_code = read_text(dbf, ix, *category_field);
    }
    if (description_field.has_value()) {
      feature.category_desc = read_text(dbf, ix, *description_field);
    }
    if (jurisdiction_field.has_value()) {
      feature.jurisdiction = read_integer(dbf, ix, *jurisdiction_field);
    }
    features.push_back(std::move(feature));
  }

  spdlog::info("read {} rows from '{}'", features.size(), filename);
  return {std::move(features), std::move(columns), epsg};
}

auto write_mapping(const std::string &filename, const ResolvedMapping &mapping)
    -> void {
  write_table(
      filename,
      {{"parcel_id", FTString, kCodeWidth},
       {"zone_code", FTString, kCodeWidth},
       {"zone_desc", FTString, kTextWidth},
       {"juris", FTInteger, kIntegerWidth}},
      mapping.rows,
      [](const ResolvedRow &row) -> const std::optional<MultiPolygon> & {
        return row.geometry;
      },
      [](DBFHandle handle, int record, const ResolvedRow &row) {
        write_string(handle, record, 0, row.parcel_id, kCodeWidth);
        write_string(handle, record, 1, row.category_code, kCodeWidth);
        write_string(handle, record, 2, row.category_desc, kTextWidth);
        if (row.jurisdiction.has_value()) {
          check_write(DBFWriteIntegerAttribute(handle, record, 3,
                                               *row.jurisdiction),
                      "juris");
        } else {
          check_write(DBFWriteNULLAttribute(handle, record, 3), "null");
        }
      });
  spdlog::info("wrote {} rows to '{}'", mapping.rows.size(), filename);
}

auto write_dissolved(const std::string &filename,
                     const DissolvedLayer &dissolved) -> void {
  write_table(
      filename,
      {{"zone_label", FTString, kCodeWidth},
       {"zone_desc", FTString, kTextWidth},
       {"members", FTInteger, kIntegerWidth}},
      dissolved.categories,
      [](const DissolvedCategory &category) {
        return std::optional<MultiPolygon>(category.geometry);
      },
      [](DBFHandle handle, int record, const DissolvedCategory &category) {
        write_string(handle, record, 0, category.label, kCodeWidth);
        write_string(handle, record, 1, category.description, kTextWidth);
        check_write(DBFWriteIntegerAttribute(
                        handle, record, 2, static_cast<int>(category.members)),
                    "members");
      });
  spdlog::info("wrote {} categories to '{}'", dissolved.categories.size(),
               filename);
}

auto write_rollups_csv(const std::string &filename,
                       const std::vector<RollupRecord> &rollups,
                       const Config &config) -> void {
  std::ofstream stream(filename);
  if (!stream) {
    throw std::runtime_error("Failed to open '" + filename + "'");
  }
  const auto &unit = config.area_unit;
  stream << fmt::format(
      "category_code,category_desc,parcel_count,total_area_{0},"
      "median_area_{0},category_area_{0},share_of_total_area,"
      "parcels_per_{0},parcel_area_ratio\n",
      unit);
  for (const auto &record : rollups) {
    stream << fmt::format(
        "{},{},{},{:.6f},{:.6f},{:.6f},{:.6f},{:.9f},{:.6f}\n",
        csv_field(record.category_code), csv_field(record.category_desc),
        record.parcel_count, record.total_area, record.median_area,
        record.category_polygon_area, record.share_of_total_area,
        record.parcels_per_area, record.parcel_area_ratio);
  }
  if (!stream) {
    throw std::runtime_error("Failed to write '" + filename + "'");
  }
  spdlog::info("wrote {} rollups to '{}'", rollups.size(), filename);
}

auto write_text(const std::string &filename, const std::string &text)
    -> void {
  std::ofstream stream(filename);
  stream << text;
  if (!stream) {
    throw std::runtime_error("Failed to write '" + filename + "'");
  }
  spdlog::info("wrote '{}'", filename);
}

auto write_lookup_csv(const std::string &filename, const Layer &zoning)
    -> void {
  std::ofstream stream(filename);
  if (!stream) {
    throw std::runtime_error("Failed to open '" + filename + "'");
  }
  auto labelled = zoning.has_column(Column::kCategoryCode);
  auto seen = std::set<std::string>();
  stream << "zoning_id,zoning_name\n";
  for (const auto &feature : zoning.features()) {
    if (!seen.insert(feature.id).second) {
      continue;
    }
    const auto &name = labelled && feature.category_code
                           ? *feature.category_code
                           : feature.id;
    stream << fmt::format("{},{}\n", csv_field(feature.id), csv_field(name));
  }
  if (!stream) {
    throw std::runtime_error("Failed to write '" + filename + "'");
  }
  spdlog::info("wrote {} zoning names to '{}' (label: {})", seen.size(),
               filename, labelled ? "zoning code" : "zoning id");
}

auto publish(const std::filesystem::path &staging,
             const std::filesystem::path &destination) -> void {
  std::filesystem::create_directories(destination);
  for (const auto &entry : std::filesystem::directory_iterator(staging)) {
    std::filesystem::rename(entry.path(),
                            destination / entry.path().filename());
  }
  std::filesystem::remove(staging);
  spdlog::debug("published '{}' to '{}'", staging.string(),
                destination.string());
}

}  // namespace zonemap
