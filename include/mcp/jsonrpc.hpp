#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace toolbox::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Deepest container nesting accepted from the wire. nlohmann's copy, dump and
// destroy paths recurse, so deeper documents are refused while parsing.
constexpr std::size_t kMaxNestingDepth = 512;

struct Success {
  nlohmann::json result;
};

struct Failure {
  int code;
  std::string message;
};

using Outcome = std::variant<Success, Failure>;

bool operator==(const Success& lhs, const Success& rhs);
bool operator==(const Failure& lhs, const Failure& rhs);

inline bool succeeded(const Outcome& outcome) { return std::holds_alternative<Success>(outcome); }

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  // Requests without an id, or with a null id, get no correlated reply.
  [[nodiscard]] bool is_notification() const { return !id.has_value() || id->is_null(); }
};

// Raised for documents that decode as JSON but are not JSON-RPC 2.0 requests.
class InvalidRequestError : public std::invalid_argument {
 public:
  InvalidRequestError(const std::string& message, nlohmann::json id);

  const nlohmann::json& id() const noexcept { return id_; }

 private:
  nlohmann::json id_;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

class NestingTooDeepError : public std::invalid_argument {
 public:
  explicit NestingTooDeepError(std::size_t limit);
};

// Json::parse with a nesting cap. Throws Json::parse_error for malformed text and
// NestingTooDeepError once a container opens below `max_depth` levels; the
// oversized subtree is skipped by the parser rather than built.
template <typename Json>
Json parse_bounded(const std::string& text, const std::size_t max_depth = kMaxNestingDepth) {
  bool too_deep = false;
  auto document = Json::parse(text, [&too_deep, max_depth](int depth, typename Json::parse_event_t event, Json&) {
    if (too_deep) {
      return false;
    }
    const bool opens = event == Json::parse_event_t::object_start || event == Json::parse_event_t::array_start;
    if (opens && static_cast<std::size_t>(depth) >= max_depth) {
      too_deep = true;
      return false;
    }
    return true;
  });
  if (too_deep) {
    throw NestingTooDeepError(max_depth);
  }
  return document;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const Failure& error);

// Serializes for transit; invalid UTF-8 in strings is replaced rather than thrown on.
std::string to_wire(const nlohmann::json& document, int indent = -1);

nlohmann::json encode_outcome(const nlohmann::json& id, const Outcome& outcome);

struct DecodedResponse {
  nlohmann::json id;
  Outcome outcome;
};

// Throws std::invalid_argument if the document is not a JSON-RPC response.
DecodedResponse decode_response(const nlohmann::json& response);

}  // namespace toolbox::mcp
