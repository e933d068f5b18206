#include "mcp/protocol.hpp"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace toolbox::mcp {

namespace {

struct ToolCallParams {
  std::string name;
  nlohmann::json arguments;
};

ToolCallParams parse_tool_call_params(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("Missing or invalid 'name' in tools/call");
  }

  ToolCallParams parsed{.name = name_it->get<std::string>(), .arguments = nlohmann::json::object()};

  const auto args_it = params.find("arguments");
  if (args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    parsed.arguments = *args_it;
  }

  return parsed;
}

nlohmann::json wrap_text_content(const nlohmann::json& result) {
  return nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", to_wire(result, 2)}}})}};
}

}  // namespace

ProtocolHandler::ProtocolHandler(const Dispatcher& dispatcher, ServerInfo info, std::ostream& log, const bool verbose)
    : dispatcher_(dispatcher), info_(std::move(info)), log_(log), verbose_(verbose) {}

ProtocolReply ProtocolHandler::parse_error_reply() {
  return ProtocolReply{.response = make_error_response(nullptr, Failure{kParseError, "Parse error"})};
}

net::awaitable<ProtocolReply> ProtocolHandler::handle_document(std::string document) const {
  nlohmann::json request;
  try {
    request = parse_bounded<nlohmann::json>(document);
  } catch (const nlohmann::json::parse_error&) {
    log_ << "[toolbox] failed to parse incoming JSON (" << document.size() << " bytes)\n";
    co_return parse_error_reply();
  } catch (const NestingTooDeepError& ex) {
    log_ << "[toolbox] rejected incoming JSON (" << document.size() << " bytes): " << ex.what() << '\n';
    co_return parse_error_reply();
  }
  co_return co_await handle(std::move(request));
}

net::awaitable<ProtocolReply> ProtocolHandler::handle(nlohmann::json request) const {
  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const InvalidRequestError& ex) {
    log_ << "[toolbox] invalid request: " << ex.what() << '\n';
    co_return ProtocolReply{.response = make_error_response(ex.id(), Failure{kInvalidRequest, ex.what()})};
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  const bool correlated = !parsed.is_notification();

  if (verbose_) {
    log_ << "[toolbox] request method=" << parsed.method << " id=" << to_wire(id) << '\n';
  }

  if (parsed.method.rfind("notifications/", 0) == 0) {
    co_return ProtocolReply{.response = nullptr, .correlated = false};
  }

  if (parsed.method == "tools/call") {
    ToolCallParams call;
    try {
      call = parse_tool_call_params(parsed.params);
    } catch (const std::invalid_argument& ex) {
      co_return ProtocolReply{.response = make_error_response(id, Failure{kInvalidParams, ex.what()}),
                              .correlated = correlated};
    }

    auto outcome = co_await dispatcher_.dispatch(call.name, std::move(call.arguments));

    ProtocolReply reply{.correlated = correlated};
    if (auto* success = std::get_if<Success>(&outcome); success != nullptr) {
      reply.response = make_result_response(id, wrap_text_content(success->result));
      reply.completed_call = CompletedCall{.tool = std::move(call.name), .result = std::move(success->result)};
    } else {
      reply.response = make_error_response(id, std::get<Failure>(outcome));
    }
    co_return reply;
  }

  try {
    if (parsed.method == "tools/list") {
      co_return ProtocolReply{.response = make_result_response(id, dispatcher_.list_tools()),
                              .correlated = correlated};
    }
    if (parsed.method == "initialize") {
      co_return ProtocolReply{.response = make_result_response(id, handle_initialize(parsed.params)),
                              .correlated = correlated};
    }
    if (parsed.method == "ping") {
      co_return ProtocolReply{.response = make_result_response(id, nlohmann::json::object()),
                              .correlated = correlated};
    }
  } catch (const std::invalid_argument& ex) {
    co_return ProtocolReply{.response = make_error_response(id, Failure{kInvalidParams, ex.what()}),
                            .correlated = correlated};
  }

  log_ << "[toolbox] unknown method '" << parsed.method << "'\n";
  co_return ProtocolReply{
      .response = make_error_response(id, Failure{kMethodNotFound, "Method not found: " + parsed.method}),
      .correlated = correlated};
}

nlohmann::json ProtocolHandler::handle_initialize(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"capabilities", {{"tools", nlohmann::json::object()}}},
                        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}};
}

}  // namespace toolbox::mcp
