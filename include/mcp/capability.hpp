#pragma once

#include <functional>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace toolbox::mcp {

namespace net = boost::asio;

using SyncHandler = std::function<nlohmann::json(const nlohmann::json&)>;
using AsyncHandler = std::function<net::awaitable<nlohmann::json>(const nlohmann::json&)>;

// A named, schema-described operation. Callers only ever see invoke(); whether
// the body completes inline or suspends is the concrete capability's business.
// Bad arguments are reported by throwing std::invalid_argument.
class Capability {
 public:
  Capability(std::string name, std::string description, nlohmann::json input_schema);
  virtual ~Capability() = default;

  Capability(const Capability&) = delete;
  Capability& operator=(const Capability&) = delete;
  Capability(Capability&&) = delete;
  Capability& operator=(Capability&&) = delete;

  const std::string& name() const noexcept { return name_; }
  const std::string& description() const noexcept { return description_; }
  const nlohmann::json& input_schema() const noexcept { return input_schema_; }

  virtual net::awaitable<nlohmann::json> invoke(const nlohmann::json& arguments) const = 0;

 private:
  std::string name_;
  std::string description_;
  nlohmann::json input_schema_;
};

class SyncCapability final : public Capability {
 public:
  SyncCapability(std::string name, std::string description, nlohmann::json input_schema, SyncHandler handler);

  net::awaitable<nlohmann::json> invoke(const nlohmann::json& arguments) const override;

 private:
  SyncHandler handler_;
};

class AsyncCapability final : public Capability {
 public:
  AsyncCapability(std::string name, std::string description, nlohmann::json input_schema, AsyncHandler handler);

  net::awaitable<nlohmann::json> invoke(const nlohmann::json& arguments) const override;

 private:
  AsyncHandler handler_;
};

}  // namespace toolbox::mcp
