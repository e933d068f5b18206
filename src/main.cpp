#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/config.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/protocol.hpp"
#include "tools/catalog.hpp"
#include "transport/connection_registry.hpp"
#include "transport/http_server.hpp"
#include "transport/stdio_transport.hpp"

namespace {

toolbox::transport::StdioTransport* g_stdio_session = nullptr;

void handle_shutdown_signal(int /*signal*/) {
  if (g_stdio_session != nullptr) {
    g_stdio_session->stop();
  }
}

// No SA_RESTART: a read blocked on the pipe has to return so the session can close.
void install_stdio_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

int run_stdio(const toolbox::mcp::ProtocolHandler& handler, const toolbox::core::GatewayConfig& config) {
  toolbox::transport::StdioTransport session{handler, std::cerr, config.verbose};
  g_stdio_session = &session;
  install_stdio_signal_handlers();

  const int rc = session.run(std::cin, std::cout);
  g_stdio_session = nullptr;
  return rc;
}

int run_http(const toolbox::mcp::ProtocolHandler& handler, const toolbox::core::GatewayConfig& config) {
  // Declared ahead of the io_context so it outlives any session frames the
  // context destroys on the way out.
  toolbox::transport::ConnectionRegistry connections;
  boost::asio::io_context context{1};

  toolbox::transport::HttpServer server{context,
                                        {.host = config.http.host,
                                         .port = config.http.port,
                                         .sse_path = config.http.sse_path,
                                         .message_path = config.http.message_path,
                                         .health_path = config.http.health_path,
                                         .keepalive_interval = config.keepalive_interval,
                                         .write_timeout = config.write_timeout,
                                         .max_pending_events = config.max_pending_events,
                                         .server_name = config.server_name,
                                         .verbose = config.verbose},
                                        handler,
                                        connections,
                                        std::cerr};

  try {
    server.start();
  } catch (const std::exception& ex) {
    std::cerr << "[toolbox] failed to start http transport: " << ex.what() << '\n';
    return 1;
  }

  boost::asio::signal_set signals{context, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int /*signal*/) {
    if (ec) {
      return;
    }
    std::cerr << "[toolbox] shutdown signal received; exiting cleanly\n";
    server.stop();
    context.stop();
  });

  context.run();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  toolbox::core::GatewayConfig config{};
  try {
    if (!config_path.empty()) {
      config = toolbox::core::load_gateway_config(config_path);
    }
    toolbox::core::apply_environment_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << toolbox::core::format_config_settings(config, config_path) << '\n';

  const auto registry = toolbox::tools::build_tool_registry({.port_check_timeout = config.port_check_timeout});
  const toolbox::mcp::Dispatcher dispatcher{registry, std::cerr, config.verbose};
  const toolbox::mcp::ProtocolHandler handler{
      dispatcher, toolbox::mcp::ServerInfo{.name = config.server_name}, std::cerr, config.verbose};

  std::cerr << "[toolbox] registered " << registry.size() << " tools\n";

  if (config.transport == toolbox::core::TransportKind::kHttp) {
    return run_http(handler, config);
  }
  return run_stdio(handler, config);
}
