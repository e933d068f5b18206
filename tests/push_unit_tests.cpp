#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "core/run_blocking.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/protocol.hpp"
#include "tools/catalog.hpp"
#include "transport/connection_registry.hpp"
#include "transport/events.hpp"
#include "transport/http_server.hpp"
#include "transport/observer_connection.hpp"
#include "transport/request_surface.hpp"

using toolbox::core::run_blocking;
using toolbox::transport::ConnectionRegistry;
using toolbox::transport::HttpServer;
using toolbox::transport::HttpServerOptions;
using toolbox::transport::NotificationEvent;
using toolbox::transport::ObserverConnection;
using toolbox::transport::RequestSurface;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kClientTimeout = std::chrono::seconds(5);

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::optional<nlohmann::json> parse_data_frame(const std::string& frame) {
  const std::string prefix = "data: ";
  if (frame.rfind(prefix, 0) != 0 || frame.size() < prefix.size() + 2 || frame.substr(frame.size() - 2) != "\n\n") {
    return std::nullopt;
  }
  return nlohmann::json::parse(frame.substr(prefix.size(), frame.size() - prefix.size() - 2));
}

std::string tool_call(int id, const std::string& name, const nlohmann::json& arguments) {
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"method", "tools/call"},
                        {"params", {{"name", name}, {"arguments", arguments}}}}
      .dump();
}

// Runs `task` on `context` until it finishes, rethrowing anything it threw.
void drive(net::io_context& context, net::awaitable<void> task) {
  std::exception_ptr failure;
  net::co_spawn(context, std::move(task), [&failure](std::exception_ptr error) { failure = error; });
  context.run();
  if (failure) {
    std::rethrow_exception(failure);
  }
}

struct Gateway {
  explicit Gateway(std::ostream& log)
      : registry(toolbox::tools::build_tool_registry()), dispatcher(registry, log), handler(dispatcher, {}, log) {}

  toolbox::mcp::CapabilityRegistry registry;
  toolbox::mcp::Dispatcher dispatcher;
  toolbox::mcp::ProtocolHandler handler;
};

// A gateway served over loopback on an ephemeral port, driven by its own thread.
class TestServer {
 public:
  explicit TestServer(std::chrono::steady_clock::duration keepalive,
                      std::chrono::steady_clock::duration write_timeout = std::chrono::seconds(30),
                      std::size_t max_pending_events = toolbox::transport::kDefaultMaxPendingEvents)
      : gateway_(log_),
        server_(context_,
                HttpServerOptions{.host = "127.0.0.1",
                                  .port = 0,
                                  .keepalive_interval = keepalive,
                                  .write_timeout = write_timeout,
                                  .max_pending_events = max_pending_events,
                                  .server_name = "push-test"},
                gateway_.handler, connections_, log_) {
    server_.start();
    thread_ = std::thread([this]() { context_.run(); });
  }

  ~TestServer() {
    net::post(context_, [this]() {
      server_.stop();
      context_.stop();
    });
    thread_.join();
  }

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  std::uint16_t port() const { return server_.port(); }
  ConnectionRegistry& connections() { return connections_; }

 private:
  std::ostringstream log_;
  Gateway gateway_;
  ConnectionRegistry connections_;
  net::io_context context_{1};
  HttpServer server_;
  std::thread thread_;
};

// Blocking test client with a deadline on every read.
class Client {
 public:
  explicit Client(std::uint16_t port) : socket_(context_) {
    socket_.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  }

  void send(const std::string& raw) { net::write(socket_, net::buffer(raw)); }

  // One chunk ending in `delimiter`, or std::nullopt on timeout/EOF.
  std::optional<std::string> read_until(const std::string& delimiter,
                                        std::chrono::steady_clock::duration timeout = kClientTimeout) {
    bool done = false;
    boost::system::error_code result;
    std::size_t length = 0;
    net::async_read_until(socket_, net::dynamic_buffer(pending_), delimiter,
                          [&](const boost::system::error_code& ec, std::size_t n) {
                            done = true;
                            result = ec;
                            length = n;
                          });
    if (!finish(done, timeout) || result) {
      return std::nullopt;
    }
    auto chunk = pending_.substr(0, length);
    pending_.erase(0, length);
    return chunk;
  }

  // Next event frame, skipping keepalive comments when asked.
  std::optional<std::string> next_frame(bool skip_keepalive,
                                        std::chrono::steady_clock::duration timeout = kClientTimeout) {
    for (;;) {
      auto frame = read_until("\n\n", timeout);
      if (!frame.has_value() || !skip_keepalive || frame->front() != ':') {
        return frame;
      }
    }
  }

  std::optional<http::response<http::string_body>> request(http::verb verb, const std::string& target,
                                                           const std::string& body = {}) {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
      req.set(http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();
    http::write(socket_, req);

    http::response<http::string_body> response;
    bool done = false;
    boost::system::error_code result;
    http::async_read(socket_, http_buffer_, response, [&](const boost::system::error_code& ec, std::size_t) {
      done = true;
      result = ec;
    });
    if (!finish(done, kClientTimeout) || result) {
      return std::nullopt;
    }
    return response;
  }

  void close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

 private:
  bool finish(const bool& done, std::chrono::steady_clock::duration timeout) {
    context_.restart();
    context_.run_for(timeout);
    if (done) {
      return true;
    }
    boost::system::error_code ignored;
    socket_.cancel(ignored);
    context_.restart();
    context_.run();
    return false;
  }

  net::io_context context_;
  tcp::socket socket_;
  std::string pending_;
  beast::flat_buffer http_buffer_;
};

// Opens an event stream and consumes the response head plus the connection event.
std::optional<std::string> open_observer(Client& client, std::string& connection_frame) {
  client.send("GET /sse HTTP/1.1\r\nHost: 127.0.0.1\r\nAccept: text/event-stream\r\n\r\n");
  auto head = client.read_until("\r\n\r\n");
  if (!head.has_value()) {
    return std::nullopt;
  }
  auto frame = client.next_frame(true);
  if (!frame.has_value()) {
    return std::nullopt;
  }
  connection_frame = *frame;
  return head;
}

bool wait_for_size(ConnectionRegistry& connections, std::size_t expected) {
  const auto deadline = std::chrono::steady_clock::now() + kClientTimeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (connections.size() == expected) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

int test_event_frames() {
  const auto connected = parse_data_frame(toolbox::transport::encode_event_frame(NotificationEvent::connection()));
  if (!connected.has_value() || (*connected)["type"] != "connection" ||
      (*connected)["message"] != "Connected to MCP toolbox event stream") {
    return fail("test_event_frames", "connection event should be a data frame with type and message");
  }

  const auto result = parse_data_frame(
      toolbox::transport::encode_event_frame(NotificationEvent::tool_result("sha256_hash", {{"hash", "ab"}})));
  if (!result.has_value() || (*result)["type"] != "tool_result" || (*result)["tool"] != "sha256_hash" ||
      (*result)["result"] != nlohmann::json{{"hash", "ab"}}) {
    return fail("test_event_frames", "tool_result event should carry the tool and its structured result");
  }

  if (std::string(toolbox::transport::kKeepaliveFrame) != ": keepalive\n\n") {
    return fail("test_event_frames", "keepalive should be a comment frame");
  }
  return 0;
}

int test_observer_connection_queue() {
  net::io_context context;
  const auto connection = std::make_shared<ObserverConnection>(net::make_strand(context), 1);
  connection->enqueue(NotificationEvent::connection());
  connection->enqueue(NotificationEvent::tool_result("base64_encode", {{"encoded", "aGk="}}));

  std::vector<ObserverConnection::Item> items;
  drive(context, [&]() -> net::awaitable<void> {
    items.push_back(co_await connection->next(std::chrono::seconds(5)));
    items.push_back(co_await connection->next(std::chrono::seconds(5)));
    items.push_back(co_await connection->next(std::chrono::milliseconds(20)));
    connection->enqueue(NotificationEvent::connection("late"));
    connection->close();
    items.push_back(co_await connection->next(std::chrono::seconds(5)));
    items.push_back(co_await connection->next(std::chrono::seconds(5)));
  }());

  using Signal = ObserverConnection::Signal;
  if (items.size() != 5 || items[0].signal != Signal::kEvent || items[1].signal != Signal::kEvent ||
      parse_data_frame(items[1].frame).value()["type"] != "tool_result") {
    return fail("test_observer_connection_queue", "queued events should drain in FIFO order");
  }
  if (items[2].signal != Signal::kKeepalive || items[2].frame != ": keepalive\n\n") {
    return fail("test_observer_connection_queue", "idle queue should yield a keepalive");
  }
  if (items[3].signal != Signal::kEvent || items[4].signal != Signal::kShutdown) {
    return fail("test_observer_connection_queue", "close should drain pending events before shutdown");
  }
  if (connection->enqueue(NotificationEvent::connection()) || connection->is_open()) {
    return fail("test_observer_connection_queue", "closed connection should refuse events");
  }
  return 0;
}

int test_observer_backlog_is_capped() {
  net::io_context context;
  const auto connection = std::make_shared<ObserverConnection>(net::make_strand(context), 3, 4);
  for (int i = 0; i < 4; ++i) {
    if (!connection->enqueue(NotificationEvent::connection())) {
      return fail("test_observer_backlog_is_capped", "events under the cap should be queued");
    }
  }
  if (connection->enqueue(NotificationEvent::connection())) {
    return fail("test_observer_backlog_is_capped", "the event past the cap should be refused");
  }
  if (connection->is_open() || connection->pending() != 0) {
    return fail("test_observer_backlog_is_capped", "overflow should close the connection and drop its backlog");
  }

  ObserverConnection::Item item;
  drive(context, [&]() -> net::awaitable<void> { item = co_await connection->next(std::chrono::seconds(5)); }());
  if (item.signal != ObserverConnection::Signal::kShutdown) {
    return fail("test_observer_backlog_is_capped", "an overflowed connection should drain straight to shutdown");
  }
  return 0;
}

int test_enqueue_wakes_idle_observer() {
  net::io_context context;
  const auto connection = std::make_shared<ObserverConnection>(net::make_strand(context), 2);

  ObserverConnection::Item item;
  std::chrono::steady_clock::duration waited{};

  // A producer on a different executor stands in for the request surface.
  net::steady_timer producer(context);
  producer.expires_after(std::chrono::milliseconds(20));
  producer.async_wait([connection](const boost::system::error_code&) {
    connection->enqueue(NotificationEvent::tool_result("sha256_hash", {{"hash", "00"}}));
  });

  drive(context, [&]() -> net::awaitable<void> {
    const auto start = std::chrono::steady_clock::now();
    item = co_await connection->next(std::chrono::seconds(10));
    waited = std::chrono::steady_clock::now() - start;
  }());

  if (item.signal != ObserverConnection::Signal::kEvent || waited > std::chrono::seconds(2)) {
    return fail("test_enqueue_wakes_idle_observer", "an event should preempt the keepalive wait");
  }
  return 0;
}

int test_connection_registry_snapshot_semantics() {
  net::io_context context;
  ConnectionRegistry connections;
  const auto first = std::make_shared<ObserverConnection>(net::make_strand(context), 1);
  const auto second = std::make_shared<ObserverConnection>(net::make_strand(context), 2);
  connections.add(first);
  connections.add(second);

  if (connections.broadcast(NotificationEvent::connection()) != 2 || first->pending() != 1 || second->pending() != 1) {
    return fail("test_connection_registry_snapshot_semantics", "broadcast should reach every registered observer");
  }

  if (!connections.remove(first) || connections.remove(first) || connections.size() != 1) {
    return fail("test_connection_registry_snapshot_semantics", "remove should drop an entry exactly once");
  }

  if (connections.broadcast(NotificationEvent::connection()) != 1 || first->pending() != 1) {
    return fail("test_connection_registry_snapshot_semantics", "removed observer should not receive broadcasts");
  }

  connections.close_all();
  if (connections.size() != 0 || second->is_open() || connections.broadcast(NotificationEvent::connection()) != 0) {
    return fail("test_connection_registry_snapshot_semantics", "close_all should shut down and forget observers");
  }
  return 0;
}

int test_registry_drops_observer_that_never_drains() {
  net::io_context context;
  ConnectionRegistry connections;
  const auto stalled = std::make_shared<ObserverConnection>(net::make_strand(context), 1, 8);
  const auto healthy = std::make_shared<ObserverConnection>(net::make_strand(context), 2);
  connections.add(stalled);
  connections.add(healthy);

  // Only `healthy` is drained; `stalled` never is.
  std::size_t released_after = 0;
  for (std::size_t round = 1; round <= 100; ++round) {
    const auto delivered = connections.broadcast(NotificationEvent::tool_result("sha256_hash", {{"hash", "00"}}));
    while (healthy->pending() > 0) {
      drive(context, [&]() -> net::awaitable<void> { (void)co_await healthy->next(std::chrono::seconds(1)); }());
      context.restart();
    }
    if (stalled->pending() > 8) {
      return fail("test_registry_drops_observer_that_never_drains", "backlog should never exceed the cap");
    }
    if (released_after == 0 && delivered == 1) {
      released_after = round;
    }
  }

  if (released_after != 9) {
    return fail("test_registry_drops_observer_that_never_drains", "the ninth undrained event should overflow");
  }
  if (connections.size() != 1 || stalled->is_open() || stalled->pending() != 0 || !healthy->is_open()) {
    return fail("test_registry_drops_observer_that_never_drains", "only the stalled observer should be released");
  }
  return 0;
}

int test_request_surface_broadcasts_successes_only() {
  std::ostringstream log;
  Gateway gateway(log);
  net::io_context context;
  ConnectionRegistry connections;
  const auto observer = std::make_shared<ObserverConnection>(net::make_strand(context), 1);
  connections.add(observer);
  const RequestSurface surface{gateway.handler, connections, log};

  const auto ok = run_blocking(surface.handle(tool_call(1, "base64_encode", {{"text", "hi"}})));
  const auto ok_body = nlohmann::json::parse(ok.body);
  if (ok.status != 200 || ok.content_type != "application/json" || ok_body["id"] != 1 ||
      nlohmann::json::parse(ok_body["result"]["content"][0]["text"].get<std::string>()) !=
          nlohmann::json{{"encoded", "aGk="}}) {
    return fail("test_request_surface_broadcasts_successes_only", "POST should answer the JSON-RPC response");
  }
  if (observer->pending() != 1) {
    return fail("test_request_surface_broadcasts_successes_only", "successful call should be broadcast");
  }

  const auto failed = run_blocking(surface.handle(tool_call(2, "missing_tool", nlohmann::json::object())));
  if (failed.status != 200 || nlohmann::json::parse(failed.body)["error"]["code"] != -32601 || observer->pending() != 1) {
    return fail("test_request_surface_broadcasts_successes_only", "failures should be answered but not broadcast");
  }

  const auto listed = run_blocking(surface.handle(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})"));
  if (nlohmann::json::parse(listed.body)["result"]["tools"].size() != 6 || observer->pending() != 1) {
    return fail("test_request_surface_broadcasts_successes_only", "tools/list should not be broadcast");
  }

  const auto garbage = run_blocking(surface.handle("not json"));
  const auto garbage_body = nlohmann::json::parse(garbage.body);
  if (garbage_body["error"]["code"] != -32700 || !garbage_body["id"].is_null()) {
    return fail("test_request_surface_broadcasts_successes_only", "bad body should be PARSE_ERROR with null id");
  }

  const auto notified = run_blocking(surface.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
  if (notified.status != 202 || !notified.body.empty()) {
    return fail("test_request_surface_broadcasts_successes_only", "notification should be accepted with no body");
  }
  return 0;
}

int test_http_broadcast_to_two_observers() {
  TestServer server(std::chrono::seconds(30));

  Client first(server.port());
  Client second(server.port());
  std::string first_connected;
  std::string second_connected;
  const auto head = open_observer(first, first_connected);
  if (!head.has_value() || !open_observer(second, second_connected).has_value()) {
    return fail("test_http_broadcast_to_two_observers", "observers should open event streams");
  }
  if (head->find("text/event-stream") == std::string::npos || head->find("X-Accel-Buffering: no") == std::string::npos ||
      head->find("Cache-Control: no-cache") == std::string::npos) {
    return fail("test_http_broadcast_to_two_observers", "event stream should disable buffering and caching");
  }
  if (parse_data_frame(first_connected).value()["type"] != "connection") {
    return fail("test_http_broadcast_to_two_observers", "first event should be the connection event");
  }

  Client caller(server.port());
  const auto response = caller.request(http::verb::post, "/message", tool_call(1, "base64_encode", {{"text", "hi"}}));
  if (!response.has_value() || response->result() != http::status::ok) {
    return fail("test_http_broadcast_to_two_observers", "POST should succeed");
  }
  const auto body = nlohmann::json::parse(response->body());
  const auto posted_result = nlohmann::json::parse(body["result"]["content"][0]["text"].get<std::string>());

  for (Client* observer : {&first, &second}) {
    const auto frame = observer->next_frame(true);
    if (!frame.has_value()) {
      return fail("test_http_broadcast_to_two_observers", "observer should receive the tool_result event");
    }
    const auto event = parse_data_frame(*frame);
    if (!event.has_value() || (*event)["type"] != "tool_result" || (*event)["tool"] != "base64_encode" ||
        (*event)["result"] != posted_result) {
      return fail("test_http_broadcast_to_two_observers", "event should match the POST result");
    }
  }

  Client late(server.port());
  std::string late_connected;
  if (!open_observer(late, late_connected).has_value()) {
    return fail("test_http_broadcast_to_two_observers", "late observer should connect");
  }
  if (late.next_frame(true, std::chrono::milliseconds(200)).has_value()) {
    return fail("test_http_broadcast_to_two_observers", "late observer should not receive earlier events");
  }

  const auto health = caller.request(http::verb::get, "/health");
  if (!health.has_value()) {
    return fail("test_http_broadcast_to_two_observers", "health should answer on a kept-alive connection");
  }
  const auto health_body = nlohmann::json::parse(health->body());
  if (health_body["status"] != "healthy" || health_body["active_connections"] != 3 ||
      health_body["transport"] != "sse" || health_body["server"] != "push-test") {
    return fail("test_http_broadcast_to_two_observers", "health should count open observers");
  }
  return 0;
}

int test_http_keepalive_and_disconnect() {
  TestServer server(std::chrono::milliseconds(100));

  Client observer(server.port());
  std::string connected;
  if (!open_observer(observer, connected).has_value()) {
    return fail("test_http_keepalive_and_disconnect", "observer should connect");
  }

  const auto idle = observer.next_frame(false);
  if (!idle.has_value() || *idle != ": keepalive\n\n") {
    return fail("test_http_keepalive_and_disconnect", "idle stream should receive a keepalive frame");
  }

  Client caller(server.port());
  if (!caller.request(http::verb::post, "/message", tool_call(5, "sha256_hash", {{"text", "hello world"}})).has_value()) {
    return fail("test_http_keepalive_and_disconnect", "POST should succeed");
  }
  const auto event = observer.next_frame(true);
  if (!event.has_value() || parse_data_frame(*event).value()["tool"] != "sha256_hash") {
    return fail("test_http_keepalive_and_disconnect", "stream should stay open across keepalives");
  }

  if (server.connections().size() != 1) {
    return fail("test_http_keepalive_and_disconnect", "registry should hold the open observer");
  }
  observer.close();
  if (!wait_for_size(server.connections(), 0)) {
    return fail("test_http_keepalive_and_disconnect", "disconnect should release the registry entry");
  }
  return 0;
}

int test_http_releases_observer_that_stops_reading() {
  TestServer server(std::chrono::seconds(30), std::chrono::milliseconds(200), 16);

  Client stalled(server.port());
  std::string connected;
  if (!open_observer(stalled, connected).has_value() || !wait_for_size(server.connections(), 1)) {
    return fail("test_http_releases_observer_that_stops_reading", "observer should connect");
  }

  // The client never reads again; large frames fill the socket buffers quickly.
  const std::string payload(64 * 1024, 'x');
  bool released = false;
  for (int round = 0; round < 5000 && !released; ++round) {
    if (server.connections().broadcast(NotificationEvent::tool_result("base64_encode", {{"encoded", payload}})) > 1) {
      return fail("test_http_releases_observer_that_stops_reading", "broadcast should reach at most one observer");
    }
    released = server.connections().size() == 0;
    if (!released) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  if (!released) {
    return fail("test_http_releases_observer_that_stops_reading", "stalled observer should be released");
  }
  if (server.connections().broadcast(NotificationEvent::connection("after")) != 0) {
    return fail("test_http_releases_observer_that_stops_reading", "released observer should get no more events");
  }

  Client fresh(server.port());
  if (!open_observer(fresh, connected).has_value() || !wait_for_size(server.connections(), 1)) {
    return fail("test_http_releases_observer_that_stops_reading", "server should keep accepting observers");
  }
  return 0;
}

int test_http_routing() {
  TestServer server(std::chrono::seconds(30));
  Client client(server.port());

  const auto options = client.request(http::verb::options, "/message");
  if (!options.has_value() || options->result() != http::status::no_content ||
      (*options)[http::field::access_control_allow_origin] != "*") {
    return fail("test_http_routing", "OPTIONS should answer 204 with CORS headers");
  }

  const auto missing = client.request(http::verb::get, "/nope");
  if (!missing.has_value() || missing->result() != http::status::not_found) {
    return fail("test_http_routing", "unknown path should be 404");
  }

  const auto wrong_verb = client.request(http::verb::get, "/message");
  if (!wrong_verb.has_value() || wrong_verb->result() != http::status::method_not_allowed) {
    return fail("test_http_routing", "GET on the message path should be 405");
  }

  const auto notified =
      client.request(http::verb::post, "/message", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  if (!notified.has_value() || notified->result() != http::status::accepted || !notified->body().empty()) {
    return fail("test_http_routing", "notification POST should be 202 with no body");
  }

  const auto garbage = client.request(http::verb::post, "/message?session=1", "{oops");
  if (!garbage.has_value() || nlohmann::json::parse(garbage->body())["error"]["code"] != -32700) {
    return fail("test_http_routing", "malformed POST body should be PARSE_ERROR");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_event_frames(); rc != 0) return rc;
  if (int rc = test_observer_connection_queue(); rc != 0) return rc;
  if (int rc = test_observer_backlog_is_capped(); rc != 0) return rc;
  if (int rc = test_enqueue_wakes_idle_observer(); rc != 0) return rc;
  if (int rc = test_connection_registry_snapshot_semantics(); rc != 0) return rc;
  if (int rc = test_registry_drops_observer_that_never_drains(); rc != 0) return rc;
  if (int rc = test_request_surface_broadcasts_successes_only(); rc != 0) return rc;
  if (int rc = test_http_broadcast_to_two_observers(); rc != 0) return rc;
  if (int rc = test_http_keepalive_and_disconnect(); rc != 0) return rc;
  if (int rc = test_http_releases_observer_that_stops_reading(); rc != 0) return rc;
  if (int rc = test_http_routing(); rc != 0) return rc;

  std::cout << "[PASS] push unit tests\n";
  return 0;
}
