#include "zonemap/config.hpp"

#include <charconv>
#include <string_view>

#include "zonemap/error.hpp"

namespace zonemap {

namespace {

// Removes leading and trailing blanks.
auto trim(std::string_view text) -> std::string_view {
  auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

// Splits a comma separated list, keeping empty items.
auto split(std::string_view text) -> std::vector<std::string_view> {
  auto result = std::vector<std::string_view>();
  size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find(',', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    result.push_back(trim(text.substr(start, end - start)));
    start = end + 1;
  }
  return result;
}

auto parse_int(std::string_view text, int &value) -> bool {
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  return ec == std::errc() && ptr == end;
}

}  // namespace

auto Config::validate() const -> void {
  if (canonical_epsg <= 0) {
    throw ContractError("configuration is missing the canonical EPSG code");
  }
  if (projected_epsg <= 0) {
    throw ContractError("configuration is missing the projected EPSG code");
  }
  if (!(area_unit_factor > 0.0)) {
    throw ContractError("configuration has no positive area unit factor");
  }
}

auto area_unit_factor(const std::string &unit) -> double {
  if (unit == "m2") {
    return 1.0;
  }
  if (unit == "ha") {
    return 1.0 / kSquareMetersPerHectare;
  }
  if (unit == "acre") {
    return 1.0 / kSquareMetersPerAcre;
  }
  if (unit == "sqft") {
    return 1.0 / kSquareMetersPerSquareFoot;
  }
  throw ContractError("unknown area unit '" + unit + "'");
}

auto parse_jurisdiction_labels(const std::string &text)
    -> std::map<int, std::string> {
  auto labels = std::map<int, std::string>();
  for (auto item : split(text)) {
    auto colon = item.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    int code = 0;
    if (!parse_int(trim(item.substr(0, colon)), code)) {
      continue;
    }
    labels[code] = std::string(trim(item.substr(colon + 1)));
  }
  return labels;
}

auto parse_jurisdictions(const std::string &text) -> std::vector<int> {
  auto codes = std::vector<int>();
  for (auto item : split(text)) {
    if (item.empty()) {
      continue;
    }
    int code = 0;
    if (!parse_int(item, code)) {
      throw ContractError("invalid jurisdiction code '" + std::string(item) +
                          "'");
    }
    codes.push_back(code);
  }
  return codes;
}

}  // namespace zonemap
