#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolbox::transport {

constexpr const char* kConnectedMessage = "Connected to MCP toolbox event stream";
constexpr std::string_view kKeepaliveFrame = ": keepalive\n\n";

struct NotificationEvent {
  enum class Kind { kConnection, kToolResult };

  Kind kind{Kind::kConnection};
  nlohmann::json payload{};

  static NotificationEvent connection(std::string message = kConnectedMessage);
  static NotificationEvent tool_result(std::string tool, nlohmann::json result);
};

const char* to_string(NotificationEvent::Kind kind);

// "data: {"type": <kind>, ...payload}\n\n"
std::string encode_event_frame(const NotificationEvent& event);

}  // namespace toolbox::transport
