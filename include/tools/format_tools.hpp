#pragma once

#include <nlohmann/json.hpp>

namespace toolbox::tools {

// {"yaml": string} -> {"json": <2-space indented JSON text>}
nlohmann::json yaml_to_json(const nlohmann::json& arguments);

// {"json": string} -> {"yaml": <block style YAML text>}
nlohmann::json json_to_yaml(const nlohmann::json& arguments);

}  // namespace toolbox::tools
