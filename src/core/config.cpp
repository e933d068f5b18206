#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbox::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
  const auto lower = to_lower(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean, got '" + value + "'");
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto port = parse_integer(key, value);
  if (port <= 0 || port > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(port);
}

TransportKind parse_transport(const std::string& key, const std::string& value) {
  const auto lower = to_lower(value);
  if (lower == "stdio") {
    return TransportKind::kStdio;
  }
  if (lower == "http" || lower == "sse") {
    return TransportKind::kHttp;
  }
  throw std::runtime_error(key + " must be 'stdio' or 'http', got '" + value + "'");
}

std::string require_path(const std::string& key, const std::string& value) {
  if (value.empty() || value.front() != '/') {
    throw std::runtime_error(key + " must start with '/'");
  }
  return value;
}

void apply_key_value(GatewayConfig& config, const std::string& key, const std::string& value) {
  if (key == "gateway.transport") {
    config.transport = parse_transport(key, value);
    return;
  }

  if (key == "gateway.server_name") {
    if (value.empty()) {
      throw std::runtime_error("gateway.server_name must not be empty");
    }
    config.server_name = value;
    return;
  }

  if (key == "http.host") {
    config.http.host = value;
    return;
  }

  if (key == "http.port") {
    config.http.port = parse_port(key, value);
    return;
  }

  if (key == "http.sse_path") {
    config.http.sse_path = require_path(key, value);
    return;
  }

  if (key == "http.message_path") {
    config.http.message_path = require_path(key, value);
    return;
  }

  if (key == "http.health_path") {
    config.http.health_path = require_path(key, value);
    return;
  }

  if (key == "sse.keepalive_seconds") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("sse.keepalive_seconds must be greater than 0");
    }
    config.keepalive_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "sse.write_timeout_seconds") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("sse.write_timeout_seconds must be greater than 0");
    }
    config.write_timeout = std::chrono::seconds(seconds);
    return;
  }

  if (key == "sse.max_pending_events") {
    const auto limit = parse_integer(key, value);
    if (limit <= 0) {
      throw std::runtime_error("sse.max_pending_events must be greater than 0");
    }
    config.max_pending_events = static_cast<std::size_t>(limit);
    return;
  }

  if (key == "tools.port_check_timeout_ms") {
    const auto timeout_ms = parse_integer(key, value);
    if (timeout_ms <= 0) {
      throw std::runtime_error("tools.port_check_timeout_ms must be greater than 0");
    }
    config.port_check_timeout = std::chrono::milliseconds(timeout_ms);
    return;
  }

  if (key == "log.verbose") {
    config.verbose = parse_bool(key, value);
  }
}

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return value;
  }
  return fallback;
}

}  // namespace

const char* to_string(const TransportKind kind) {
  switch (kind) {
    case TransportKind::kStdio:
      return "stdio";
    case TransportKind::kHttp:
      return "http";
  }
  return "unknown";
}

GatewayConfig load_gateway_config(const std::string& path) {
  GatewayConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.resize(depth);
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment_overrides(GatewayConfig& config) {
  if (const auto transport = getenv_or("TOOLBOX_TRANSPORT", ""); !transport.empty()) {
    config.transport = parse_transport("TOOLBOX_TRANSPORT", transport);
  }
  config.http.host = getenv_or("TOOLBOX_HTTP_HOST", config.http.host);
  if (const auto port = getenv_or("TOOLBOX_HTTP_PORT", ""); !port.empty()) {
    config.http.port = parse_port("TOOLBOX_HTTP_PORT", port);
  }
  if (const auto verbose = getenv_or("TOOLBOX_VERBOSE", ""); !verbose.empty()) {
    config.verbose = parse_bool("TOOLBOX_VERBOSE", verbose);
  }
}

std::string format_config_settings(const GatewayConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[toolbox] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | transport=" << to_string(config.transport) << " | server_name=" << config.server_name;

  if (config.transport == TransportKind::kHttp) {
    output << " | http=" << config.http.host << ':' << config.http.port << " | sse_path=" << config.http.sse_path
           << " | message_path=" << config.http.message_path << " | health_path=" << config.http.health_path
           << " | keepalive_s=" << config.keepalive_interval.count()
           << " | write_timeout_s=" << config.write_timeout.count()
           << " | max_pending_events=" << config.max_pending_events;
  }

  output << " | port_check_timeout_ms=" << config.port_check_timeout.count()
         << " | verbose=" << (config.verbose ? "true" : "false");
  return output.str();
}

}  // namespace toolbox::core
