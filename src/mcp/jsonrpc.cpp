#include "mcp/jsonrpc.hpp"

#include <string>
#include <utility>

namespace toolbox::mcp {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

const nlohmann::json* member(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

nlohmann::json envelope(const nlohmann::json& id) { return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}}; }

}  // namespace

bool operator==(const Success& lhs, const Success& rhs) { return lhs.result == rhs.result; }

bool operator==(const Failure& lhs, const Failure& rhs) {
  return lhs.code == rhs.code && lhs.message == rhs.message;
}

InvalidRequestError::InvalidRequestError(const std::string& message, nlohmann::json id)
    : std::invalid_argument(message), id_(std::move(id)) {}

NestingTooDeepError::NestingTooDeepError(const std::size_t limit)
    : std::invalid_argument("document nesting exceeds " + std::to_string(limit) + " levels") {}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequestError("Request must be a JSON object", nullptr);
  }

  // The id is settled first so every later rejection can echo it back.
  JsonRpcRequest parsed{};
  if (const auto* id = member(request, "id"); id != nullptr) {
    if (!is_valid_id(*id)) {
      throw InvalidRequestError("id must be string, integer, or null", nullptr);
    }
    parsed.id = *id;
  }
  const auto reply_id = parsed.id.value_or(nullptr);

  const auto* version = member(request, "jsonrpc");
  if (version == nullptr || *version != kJsonRpcVersion) {
    throw InvalidRequestError("jsonrpc must be \"2.0\"", reply_id);
  }

  const auto* method = member(request, "method");
  if (method == nullptr || !method->is_string()) {
    throw InvalidRequestError("method must be a string", reply_id);
  }
  parsed.method = method->get<std::string>();

  parsed.params = nlohmann::json::object();
  if (const auto* params = member(request, "params"); params != nullptr && !params->is_null()) {
    if (!params->is_structured()) {
      throw InvalidRequestError("params must be an object or an array", reply_id);
    }
    parsed.params = *params;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  auto response = envelope(id);
  response["result"] = result;
  return response;
}

nlohmann::json make_error_response(const nlohmann::json& id, const Failure& error) {
  auto response = envelope(id);
  response["error"] = {{"code", error.code}, {"message", error.message}};
  return response;
}

std::string to_wire(const nlohmann::json& document, const int indent) {
  return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json encode_outcome(const nlohmann::json& id, const Outcome& outcome) {
  if (const auto* success = std::get_if<Success>(&outcome); success != nullptr) {
    return make_result_response(id, success->result);
  }
  return make_error_response(id, std::get<Failure>(outcome));
}

DecodedResponse decode_response(const nlohmann::json& response) {
  if (!response.is_object()) {
    throw std::invalid_argument("response must be a JSON object");
  }

  const auto jsonrpc_it = response.find("jsonrpc");
  if (jsonrpc_it == response.end() || *jsonrpc_it != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  const auto id_it = response.find("id");
  if (id_it == response.end() || !is_valid_id(*id_it)) {
    throw std::invalid_argument("response id must be string, integer, or null");
  }

  const auto result_it = response.find("result");
  const auto error_it = response.find("error");
  if ((result_it == response.end()) == (error_it == response.end())) {
    throw std::invalid_argument("response must carry exactly one of result or error");
  }

  if (result_it != response.end()) {
    return DecodedResponse{.id = *id_it, .outcome = Success{*result_it}};
  }

  if (!error_it->is_object()) {
    throw std::invalid_argument("error must be an object");
  }
  const auto code_it = error_it->find("code");
  const auto message_it = error_it->find("message");
  if (code_it == error_it->end() || !code_it->is_number_integer() || message_it == error_it->end() ||
      !message_it->is_string()) {
    throw std::invalid_argument("error must carry an integer code and a string message");
  }

  return DecodedResponse{.id = *id_it,
                         .outcome = Failure{code_it->get<int>(), message_it->get<std::string>()}};
}

}  // namespace toolbox::mcp
