#include "transport/http_server.hpp"

#include <array>
#include <exception>
#include <ostream>
#include <string_view>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace toolbox::transport {

namespace {

constexpr auto kRequestReadTimeout = std::chrono::seconds(60);

constexpr std::string_view kEventStreamHeader =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Cache-Control: no-cache\r\n"
    "Connection: keep-alive\r\n"
    "X-Accel-Buffering: no\r\n"
    "Access-Control-Allow-Origin: *\r\n"
    "\r\n";

// Unregisters an event stream however its drain loop ends.
class ObserverRegistration {
 public:
  ObserverRegistration(ConnectionRegistry& connections, std::shared_ptr<ObserverConnection> connection)
      : connections_(connections), connection_(std::move(connection)) {
    connections_.add(connection_);
  }

  ~ObserverRegistration() {
    connections_.remove(connection_);
    connection_->close();
  }

  ObserverRegistration(const ObserverRegistration&) = delete;
  ObserverRegistration& operator=(const ObserverRegistration&) = delete;

 private:
  ConnectionRegistry& connections_;
  std::shared_ptr<ObserverConnection> connection_;
};

auto log_failures(std::ostream& log, const char* task) {
  return [&log, task](std::exception_ptr failure) {
    if (!failure) {
      return;
    }
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& ex) {
      log << "[http] " << task << " failed: " << ex.what() << '\n';
    }
  };
}

std::string request_path(const http::request<http::string_body>& request) {
  std::string target(request.target().data(), request.target().size());
  if (const auto query = target.find_first_of("?#"); query != std::string::npos) {
    target.erase(query);
  }
  return target;
}

}  // namespace

HttpServer::HttpServer(net::io_context& context, HttpServerOptions options, const mcp::ProtocolHandler& handler,
                       ConnectionRegistry& connections, std::ostream& log)
    : context_(context),
      options_(std::move(options)),
      connections_(connections),
      surface_(handler, connections, log, options_.verbose),
      log_(log),
      acceptor_(net::make_strand(context)) {}

void HttpServer::start() {
  const tcp::endpoint endpoint{net::ip::make_address(options_.host), options_.port};

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);

  log_ << "[http] listening on " << options_.host << ':' << port() << " | sse=" << options_.sse_path
       << " | message=" << options_.message_path << " | health=" << options_.health_path << '\n';

  net::co_spawn(acceptor_.get_executor(), accept_loop(), log_failures(log_, "accept loop"));
}

void HttpServer::stop() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);

  const auto open_streams = connections_.size();
  connections_.close_all();
  log_ << "[http] stopped; closed " << open_streams << " event stream(s)\n";
}

std::uint16_t HttpServer::port() const {
  boost::system::error_code ec;
  const auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? options_.port : endpoint.port();
}

net::awaitable<void> HttpServer::accept_loop() {
  for (;;) {
    tcp::socket socket(net::make_strand(context_));
    boost::system::error_code ec;
    co_await acceptor_.async_accept(socket, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        co_return;
      }
      log_ << "[http] accept failed: " << ec.message() << '\n';
      continue;
    }

    auto executor = socket.get_executor();
    net::co_spawn(executor, serve(std::move(socket)), log_failures(log_, "session"));
  }
}

net::awaitable<void> HttpServer::serve(tcp::socket socket) {
  auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
  beast::flat_buffer buffer;
  boost::system::error_code ec;

  for (;;) {
    http::request<http::string_body> request;
    stream->expires_after(kRequestReadTimeout);
    co_await http::async_read(*stream, buffer, request, net::redirect_error(net::use_awaitable, ec));
    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec) {
      if (options_.verbose) {
        log_ << "[http] read failed: " << ec.message() << '\n';
      }
      break;
    }

    if (options_.verbose) {
      log_ << "[http] " << request.method_string() << ' ' << request.target() << '\n';
    }

    if (request.method() == http::verb::get && request_path(request) == options_.sse_path) {
      co_await stream_events(stream);
      co_return;
    }

    auto response = co_await route(request);
    response.keep_alive(request.keep_alive());
    response.prepare_payload();

    co_await http::async_write(*stream, response, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      log_ << "[http] write failed: " << ec.message() << '\n';
      break;
    }
    if (!response.keep_alive()) {
      break;
    }
  }

  stream->socket().shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<HttpServer::Response> HttpServer::route(const http::request<http::string_body>& request) const {
  const auto path = request_path(request);
  const auto method = request.method();

  if (method == http::verb::options) {
    Response response{http::status::no_content, request.version()};
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    co_return response;
  }

  const bool known_path = path == options_.sse_path || path == options_.message_path || path == options_.health_path;
  if (!known_path) {
    co_return make_json_response(request, http::status::not_found, R"({"error":"not found"})");
  }

  if (path == options_.health_path && method == http::verb::get) {
    co_return make_json_response(request, http::status::ok, health_body());
  }

  if (path == options_.message_path && method == http::verb::post) {
    const auto reply = co_await surface_.handle(request.body());
    if (reply.status == 202) {
      Response response{http::status::accepted, request.version()};
      response.set(http::field::access_control_allow_origin, "*");
      co_return response;
    }
    co_return make_json_response(request, static_cast<http::status>(reply.status), reply.body);
  }

  auto response = make_json_response(request, http::status::method_not_allowed, R"({"error":"method not allowed"})");
  response.set(http::field::allow, path == options_.message_path ? "POST, OPTIONS" : "GET, OPTIONS");
  co_return response;
}

net::awaitable<void> HttpServer::stream_events(std::shared_ptr<beast::tcp_stream> stream) {
  stream->expires_never();
  auto& socket = stream->socket();

  boost::system::error_code ec;
  co_await net::async_write(socket, net::buffer(kEventStreamHeader.data(), kEventStreamHeader.size()),
                            net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    log_ << "[sse] failed to open event stream: " << ec.message() << '\n';
    co_return;
  }

  const auto connection =
      std::make_shared<ObserverConnection>(socket.get_executor(), next_observer_id_++, options_.max_pending_events);
  {
    ObserverRegistration registration(connections_, connection);
    log_ << "[sse] observer " << connection->id() << " connected (active=" << connections_.size() << ")\n";

    connection->enqueue(NotificationEvent::connection());
    net::co_spawn(socket.get_executor(), watch_disconnect(stream, connection), log_failures(log_, "disconnect watch"));

    for (;;) {
      const auto item = co_await connection->next(options_.keepalive_interval);
      if (item.signal == ObserverConnection::Signal::kShutdown) {
        break;
      }

      // The deadline applies only to writes issued through the stream; the
      // disconnect watch reads the raw socket and stays unbounded.
      stream->expires_after(options_.write_timeout);
      co_await net::async_write(*stream, net::buffer(item.frame), net::redirect_error(net::use_awaitable, ec));
      stream->expires_never();
      if (ec == beast::error::timeout) {
        log_ << "[sse] observer " << connection->id() << " stalled; dropping it\n";
        break;
      }
      if (ec) {
        log_ << "[sse] observer " << connection->id() << " write failed: " << ec.message() << '\n';
        break;
      }
    }
  }

  log_ << "[sse] observer " << connection->id() << " disconnected (active=" << connections_.size() << ")\n";
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);
}

net::awaitable<void> HttpServer::watch_disconnect(std::shared_ptr<beast::tcp_stream> stream,
                                                  std::shared_ptr<ObserverConnection> connection) {
  // Observers never send after the request; any read completion means the peer
  // went away or the stream was torn down locally.
  std::array<char, 512> scratch{};
  boost::system::error_code ec;
  while (connection->is_open()) {
    co_await stream->socket().async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      break;
    }
  }

  connections_.remove(connection);
  connection->close();
}

HttpServer::Response HttpServer::make_json_response(const http::request<http::string_body>& request,
                                                    const http::status status, std::string body) const {
  Response response{status, request.version()};
  response.set(http::field::server, options_.server_name);
  response.set(http::field::content_type, "application/json");
  response.set(http::field::access_control_allow_origin, "*");
  response.body() = std::move(body);
  return response;
}

std::string HttpServer::health_body() const {
  return mcp::to_wire(nlohmann::json{{"status", "healthy"},
                                     {"server", options_.server_name},
                                     {"transport", "sse"},
                                     {"active_connections", connections_.size()}});
}

}  // namespace toolbox::transport
