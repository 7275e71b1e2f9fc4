#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace zonemap {

/// @brief Raised when an input violates the data contract: a required column
/// or coordinate reference is missing, or the configuration is unusable.
class ContractError : public std::invalid_argument {
 public:
  explicit ContractError(const std::string &message)
      : std::invalid_argument(message) {}
};

/// @brief Raised when a global geometric operation (the union of a dissolve
/// group) fails after repair.
class TopologyError : public std::runtime_error {
 public:
  /// @param[in] label The category label whose union failed.
  /// @param[in] reason The message of the underlying exception.
  TopologyError(std::string label, const std::string &reason)
      : std::runtime_error("union failed for category '" + label +
                           "': " + reason),
        label_(std::move(label)) {}

  /// Get the label of the group that failed.
  auto label() const noexcept -> const std::string & {
    return label_;
  }

 private:
  std::string label_;
};

}  // namespace zonemap
