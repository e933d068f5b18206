#pragma once

#include <iosfwd>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcp/protocol.hpp"
#include "transport/connection_registry.hpp"

namespace toolbox::transport {

struct HttpReply {
  unsigned status{200};
  std::string body{};
  std::string content_type{"application/json"};
};

// The POST side of the push binding: one JSON-RPC document in, one response out.
// A successful tools/call is also announced to every open event stream.
class RequestSurface {
 public:
  RequestSurface(const mcp::ProtocolHandler& handler, ConnectionRegistry& connections, std::ostream& log,
                 bool verbose = false);

  net::awaitable<HttpReply> handle(std::string body) const;

 private:
  const mcp::ProtocolHandler& handler_;
  ConnectionRegistry& connections_;
  std::ostream& log_;
  bool verbose_{false};
};

}  // namespace toolbox::transport
