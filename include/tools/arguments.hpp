#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace toolbox::tools {

// Both throw std::invalid_argument naming the offending argument.
std::string require_string(const nlohmann::json& arguments, const char* key);
std::int64_t require_integer(const nlohmann::json& arguments, const char* key);

}  // namespace toolbox::tools
