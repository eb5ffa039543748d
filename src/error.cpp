#include "edgetrp/core/error.hpp"

#include <utility>

namespace edgetrp::core {

namespace {
std::string with_key(const std::string& message, const std::string& region,
                     const std::string& node, Year year) {
  std::string out = message;
  out += " [region=" + (region.empty() ? std::string("-") : region);
  if (!node.empty()) out += ", node=" + node;
  if (year != 0) out += ", year=" + std::to_string(year);
  out += "]";
  return out;
}
} // namespace

ModelError::ModelError(const std::string& message, std::string region, std::string node, Year year)
  : std::runtime_error(with_key(message, region, node, year)),
    region_(std::move(region)), node_(std::move(node)), year_(year) {}

} // namespace edgetrp::core
