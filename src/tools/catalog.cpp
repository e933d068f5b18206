#include "tools/catalog.hpp"

#include <memory>
#include <string>
#include <utility>

#include "tools/format_tools.hpp"
#include "tools/network_tools.hpp"
#include "tools/text_tools.hpp"

namespace toolbox::tools {

namespace {

nlohmann::json string_schema(const std::string& property, const std::string& description) {
  return nlohmann::json{{"type", "object"},
                        {"properties", {{property, {{"type", "string"}, {"description", description}}}}},
                        {"required", nlohmann::json::array({property})}};
}

nlohmann::json port_check_schema() {
  return nlohmann::json{
      {"type", "object"},
      {"properties",
       {{"host", {{"type", "string"}, {"description", "Hostname or IP address to check"}}},
        {"port",
         {{"type", "integer"}, {"description", "Port number (1-65535)"}, {"minimum", 1}, {"maximum", 65535}}}}},
      {"required", nlohmann::json::array({"host", "port"})}};
}

}  // namespace

mcp::CapabilityRegistry build_tool_registry(const ToolOptions& options) {
  mcp::CapabilityRegistry registry;

  registry.add_sync("yaml_to_json",
                    "Convert YAML string to JSON format. Useful for configuration file transformations and data "
                    "interchange.",
                    string_schema("yaml", "YAML string to convert to JSON"), yaml_to_json);

  registry.add_sync("json_to_yaml",
                    "Convert JSON string to YAML format. YAML is more human-readable and commonly used in "
                    "configuration files.",
                    string_schema("json", "JSON string to convert to YAML"), json_to_yaml);

  registry.add_sync("base64_encode",
                    "Encode text string to base64 format. Used for representing binary data in ASCII format.",
                    string_schema("text", "Plain text to encode"), base64_encode);

  registry.add_sync("sha256_hash",
                    "Compute SHA256 cryptographic hash of text. Produces a 64-character hexadecimal hash string.",
                    string_schema("text", "Text to hash"), sha256_hash);

  std::shared_ptr<HostResolver> resolver = options.resolver;
  if (resolver == nullptr) {
    resolver = std::make_shared<SystemResolver>();
  }
  const auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(options.port_check_timeout).count();
  registry.add_async("is_port_open",
                     "Check if a TCP port is open on a host. Useful for service availability and network "
                     "diagnostics. Times out after " +
                         (timeout_ms % 1000 == 0 ? std::to_string(timeout_ms / 1000) + " seconds."
                                                 : std::to_string(timeout_ms) + " milliseconds."),
                     port_check_schema(),
                     [resolver = std::move(resolver), timeout = options.port_check_timeout](
                         const nlohmann::json& arguments) { return is_port_open(arguments, *resolver, timeout); });

  registry.add_sync("validate_url",
                    "Validate URL format and structure. Checks for protocol, domain, and invalid characters.",
                    string_schema("url", "URL to validate"), validate_url);

  return registry;
}

}  // namespace toolbox::tools
