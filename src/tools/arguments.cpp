#include "tools/arguments.hpp"

#include <limits>
#include <stdexcept>

namespace toolbox::tools {

namespace {

const nlohmann::json& require_argument(const nlohmann::json& arguments, const char* key) {
  if (!arguments.is_object()) {
    throw std::invalid_argument("arguments must be an object");
  }
  const auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    throw std::invalid_argument(std::string("Missing required argument: ") + key);
  }
  return *it;
}

}  // namespace

std::string require_string(const nlohmann::json& arguments, const char* key) {
  const auto& value = require_argument(arguments, key);
  if (!value.is_string()) {
    throw std::invalid_argument(std::string("Argument '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::int64_t require_integer(const nlohmann::json& arguments, const char* key) {
  const auto& value = require_argument(arguments, key);
  if (value.is_number_unsigned() &&
      value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw std::invalid_argument(std::string("Argument '") + key + "' is out of range, got " + value.dump());
  }
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string("Argument '") + key + "' must be an integer");
  }
  return value.get<std::int64_t>();
}

}  // namespace toolbox::tools
