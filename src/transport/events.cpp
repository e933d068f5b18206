#include "transport/events.hpp"

#include <utility>

#include "mcp/jsonrpc.hpp"

namespace toolbox::transport {

NotificationEvent NotificationEvent::connection(std::string message) {
  return NotificationEvent{.kind = Kind::kConnection, .payload = {{"message", std::move(message)}}};
}

NotificationEvent NotificationEvent::tool_result(std::string tool, nlohmann::json result) {
  return NotificationEvent{.kind = Kind::kToolResult,
                           .payload = {{"tool", std::move(tool)}, {"result", std::move(result)}}};
}

const char* to_string(const NotificationEvent::Kind kind) {
  switch (kind) {
    case NotificationEvent::Kind::kConnection:
      return "connection";
    case NotificationEvent::Kind::kToolResult:
      return "tool_result";
  }
  return "unknown";
}

std::string encode_event_frame(const NotificationEvent& event) {
  nlohmann::json data = event.payload.is_object() ? event.payload : nlohmann::json::object();
  data["type"] = to_string(event.kind);
  return "data: " + mcp::to_wire(data) + "\n\n";
}

}  // namespace toolbox::transport
