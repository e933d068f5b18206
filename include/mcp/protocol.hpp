#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcp/dispatcher.hpp"
#include "mcp/jsonrpc.hpp"

namespace toolbox::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerInfo {
  std::string name{"mcp-toolbox"};
  std::string version{"0.1.0"};
};

// A tools/call that produced a result, kept so transports can announce it.
struct CompletedCall {
  std::string tool;
  nlohmann::json result;
};

struct ProtocolReply {
  // Null when the request was a notification method and nothing is sent back.
  nlohmann::json response{};
  // False when the request carried no usable id; correlated writers skip it.
  bool correlated{true};
  std::optional<CompletedCall> completed_call{};
};

// JSON-RPC routing shared by every transport binding, so both present the same
// request/response semantics.
class ProtocolHandler {
 public:
  ProtocolHandler(const Dispatcher& dispatcher, ServerInfo info, std::ostream& log, bool verbose = false);

  net::awaitable<ProtocolReply> handle(nlohmann::json request) const;

  // Decodes one wire document first; undecodable text, or text nested deeper
  // than kMaxNestingDepth, becomes a PARSE_ERROR reply with a null id.
  net::awaitable<ProtocolReply> handle_document(std::string document) const;

  static ProtocolReply parse_error_reply();

  const ServerInfo& server_info() const noexcept { return info_; }

 private:
  nlohmann::json handle_initialize(const nlohmann::json& params) const;

  const Dispatcher& dispatcher_;
  ServerInfo info_;
  std::ostream& log_;
  bool verbose_{false};
};

}  // namespace toolbox::mcp
