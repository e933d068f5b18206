#include "tools/format_tools.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "mcp/jsonrpc.hpp"
#include "tools/arguments.hpp"

namespace toolbox::tools {

namespace {

constexpr std::array<std::string_view, 4> kNullScalars = {"~", "null", "Null", "NULL"};
constexpr std::array<std::string_view, 9> kTrueScalars = {"true", "True", "TRUE", "yes", "Yes",
                                                          "YES",  "on",   "On",   "ON"};
constexpr std::array<std::string_view, 9> kFalseScalars = {"false", "False", "FALSE", "no", "No",
                                                           "NO",    "off",   "Off",   "OFF"};

template <std::size_t N>
bool matches_any(const std::string& text, const std::array<std::string_view, N>& candidates) {
  for (const auto candidate : candidates) {
    if (text == candidate) {
      return true;
    }
  }
  return false;
}

bool parse_integer(const std::string& text, std::int64_t& value) {
  std::string_view digits(text);
  bool negative = false;
  if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }

  int base = 10;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    base = 16;
    digits.remove_prefix(2);
  }
  if (digits.empty()) {
    return false;
  }

  std::uint64_t magnitude = 0;
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    return false;
  }
  if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }

  value = negative ? -static_cast<std::int64_t>(magnitude) : static_cast<std::int64_t>(magnitude);
  return true;
}

bool parse_float(const std::string& text, double& value) {
  if (text == ".inf" || text == ".Inf" || text == ".INF" || text == "+.inf") {
    value = std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
    value = -std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == ".nan" || text == ".NaN" || text == ".NAN") {
    value = std::numeric_limits<double>::quiet_NaN();
    return true;
  }

  // YAML 1.1 floats carry a decimal point; "1e5" stays a string.
  if (text.find('.') == std::string::npos) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != nullptr && end != text.c_str() && *end == '\0';
}

nlohmann::ordered_json resolve_scalar(const YAML::Node& node) {
  const auto& text = node.Scalar();
  const auto& tag = node.Tag();

  // Quoted scalars carry the "!" tag and are always strings.
  if (tag == "!" || tag == "tag:yaml.org,2002:str") {
    return text;
  }
  if (text.empty() || matches_any(text, kNullScalars)) {
    return nullptr;
  }
  if (matches_any(text, kTrueScalars)) {
    return true;
  }
  if (matches_any(text, kFalseScalars)) {
    return false;
  }

  std::int64_t integer = 0;
  if (parse_integer(text, integer)) {
    return integer;
  }
  double floating = 0.0;
  if (parse_float(text, floating)) {
    return floating;
  }
  return text;
}

nlohmann::ordered_json yaml_node_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return resolve_scalar(node);
    case YAML::NodeType::Sequence: {
      auto array = nlohmann::ordered_json::array();
      for (const auto& item : node) {
        array.push_back(yaml_node_to_json(item));
      }
      return array;
    }
    case YAML::NodeType::Map: {
      auto object = nlohmann::ordered_json::object();
      for (const auto& entry : node) {
        const auto key = entry.first.IsScalar() ? entry.first.Scalar() : YAML::Dump(entry.first);
        object[key] = yaml_node_to_json(entry.second);
      }
      return object;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

void emit_yaml(YAML::Emitter& out, const nlohmann::ordered_json& value) {
  switch (value.type()) {
    case nlohmann::ordered_json::value_t::object:
      out << YAML::BeginMap;
      for (const auto& item : value.items()) {
        out << YAML::Key << item.key() << YAML::Value;
        emit_yaml(out, item.value());
      }
      out << YAML::EndMap;
      return;
    case nlohmann::ordered_json::value_t::array:
      out << YAML::BeginSeq;
      for (const auto& item : value) {
        emit_yaml(out, item);
      }
      out << YAML::EndSeq;
      return;
    case nlohmann::ordered_json::value_t::string:
      out << value.get_ref<const std::string&>();
      return;
    case nlohmann::ordered_json::value_t::boolean:
      out << value.get<bool>();
      return;
    case nlohmann::ordered_json::value_t::number_integer:
      out << value.get<std::int64_t>();
      return;
    case nlohmann::ordered_json::value_t::number_unsigned:
      out << value.get<std::uint64_t>();
      return;
    case nlohmann::ordered_json::value_t::number_float:
      out << value.get<double>();
      return;
    case nlohmann::ordered_json::value_t::null:
    case nlohmann::ordered_json::value_t::binary:
    case nlohmann::ordered_json::value_t::discarded:
      out << YAML::Null;
      return;
  }
}

}  // namespace

nlohmann::json yaml_to_json(const nlohmann::json& arguments) {
  const auto text = require_string(arguments, "yaml");

  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& ex) {
    throw std::invalid_argument(std::string("Invalid YAML input: ") + ex.what());
  }

  const auto data = yaml_node_to_json(root);
  return nlohmann::json{{"json", data.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)}};
}

nlohmann::json json_to_yaml(const nlohmann::json& arguments) {
  const auto text = require_string(arguments, "json");

  nlohmann::ordered_json data;
  try {
    data = mcp::parse_bounded<nlohmann::ordered_json>(text);
  } catch (const nlohmann::ordered_json::parse_error& ex) {
    throw std::invalid_argument(std::string("Invalid JSON input: ") + ex.what());
  } catch (const mcp::NestingTooDeepError& ex) {
    throw std::invalid_argument(std::string("Invalid JSON input: ") + ex.what());
  }

  YAML::Emitter out;
  out.SetNullFormat(YAML::LowerNull);
  out.SetBoolFormat(YAML::TrueFalseBool);
  out.SetDoublePrecision(15);
  emit_yaml(out, data);
  if (!out.good()) {
    throw std::runtime_error("YAML emitter failed: " + out.GetLastError());
  }

  std::string yaml = out.c_str();
  yaml.push_back('\n');
  return nlohmann::json{{"yaml", yaml}};
}

}  // namespace toolbox::tools
