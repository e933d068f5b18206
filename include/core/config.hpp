#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace toolbox::core {

enum class TransportKind { kStdio, kHttp };

const char* to_string(TransportKind kind);

struct HttpConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};
  std::string sse_path{"/sse"};
  std::string message_path{"/message"};
  std::string health_path{"/health"};
};

struct GatewayConfig {
  TransportKind transport{TransportKind::kStdio};
  std::string server_name{"mcp-toolbox"};
  HttpConfig http{};
  std::chrono::seconds keepalive_interval{30};
  std::chrono::seconds write_timeout{30};
  std::size_t max_pending_events{1024};
  std::chrono::milliseconds port_check_timeout{3000};
  bool verbose{false};
};

// Indentation-scoped "key: value" file; unknown keys are ignored. Throws
// std::runtime_error for an unreadable file or a malformed value.
GatewayConfig load_gateway_config(const std::string& path);

// TOOLBOX_TRANSPORT, TOOLBOX_HTTP_HOST, TOOLBOX_HTTP_PORT and TOOLBOX_VERBOSE
// win over whatever the file said.
void apply_environment_overrides(GatewayConfig& config);

std::string format_config_settings(const GatewayConfig& config, const std::string& config_path);

}  // namespace toolbox::core
