#pragma once

#include <nlohmann/json.hpp>

namespace toolbox::tools {

// {"text": string} -> {"encoded": standard base64 with padding}
nlohmann::json base64_encode(const nlohmann::json& arguments);

// {"text": string} -> {"hash": 64 lowercase hex chars}
nlohmann::json sha256_hash(const nlohmann::json& arguments);

}  // namespace toolbox::tools
