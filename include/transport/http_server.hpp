#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "mcp/protocol.hpp"
#include "transport/connection_registry.hpp"
#include "transport/request_surface.hpp"

namespace toolbox::transport {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

struct HttpServerOptions {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};
  std::string sse_path{"/sse"};
  std::string message_path{"/message"};
  std::string health_path{"/health"};
  std::chrono::steady_clock::duration keepalive_interval{std::chrono::seconds(30)};
  // An event stream whose peer stops reading is dropped once one frame write
  // stalls this long or max_pending_events frames back up behind it.
  std::chrono::steady_clock::duration write_timeout{std::chrono::seconds(30)};
  std::size_t max_pending_events{kDefaultMaxPendingEvents};
  std::string server_name{"mcp-toolbox"};
  bool verbose{false};
};

// HTTP binding: GET <sse_path> opens an event stream, POST <message_path> takes
// JSON-RPC requests and GET <health_path> reports liveness. Every connection
// runs on its own strand of the shared io_context.
//
// The registry must outlive the io_context: sessions still suspended when the
// context is destroyed unregister themselves on the way out.
class HttpServer {
 public:
  HttpServer(net::io_context& context, HttpServerOptions options, const mcp::ProtocolHandler& handler,
             ConnectionRegistry& connections, std::ostream& log);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts accepting. Throws boost::system::system_error if the
  // address cannot be bound.
  void start();

  // Stops accepting and signals shutdown to every open event stream.
  void stop();

  // The bound port; differs from the configured one when that was 0.
  std::uint16_t port() const;

  const HttpServerOptions& options() const noexcept { return options_; }

 private:
  using Response = http::response<http::string_body>;

  net::awaitable<void> accept_loop();
  net::awaitable<void> serve(tcp::socket socket);
  net::awaitable<Response> route(const http::request<http::string_body>& request) const;
  net::awaitable<void> stream_events(std::shared_ptr<beast::tcp_stream> stream);
  net::awaitable<void> watch_disconnect(std::shared_ptr<beast::tcp_stream> stream,
                                        std::shared_ptr<ObserverConnection> connection);

  Response make_json_response(const http::request<http::string_body>& request, http::status status,
                              std::string body) const;
  std::string health_body() const;

  net::io_context& context_;
  HttpServerOptions options_;
  ConnectionRegistry& connections_;
  RequestSurface surface_;
  std::ostream& log_;
  tcp::acceptor acceptor_;
  std::atomic<std::uint64_t> next_observer_id_{1};
};

}  // namespace toolbox::transport
