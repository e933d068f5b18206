#include "mcp/capability.hpp"

#include <stdexcept>
#include <utility>

namespace toolbox::mcp {

Capability::Capability(std::string name, std::string description, nlohmann::json input_schema)
    : name_(std::move(name)), description_(std::move(description)), input_schema_(std::move(input_schema)) {
  if (name_.empty()) {
    throw std::invalid_argument("capability name must not be empty");
  }
  if (!input_schema_.is_object()) {
    throw std::invalid_argument("capability '" + name_ + "' input schema must be an object");
  }
}

SyncCapability::SyncCapability(std::string name, std::string description, nlohmann::json input_schema,
                               SyncHandler handler)
    : Capability(std::move(name), std::move(description), std::move(input_schema)), handler_(std::move(handler)) {
  if (!handler_) {
    throw std::invalid_argument("capability '" + this->name() + "' has no handler");
  }
}

net::awaitable<nlohmann::json> SyncCapability::invoke(const nlohmann::json& arguments) const {
  co_return handler_(arguments);
}

AsyncCapability::AsyncCapability(std::string name, std::string description, nlohmann::json input_schema,
                                 AsyncHandler handler)
    : Capability(std::move(name), std::move(description), std::move(input_schema)), handler_(std::move(handler)) {
  if (!handler_) {
    throw std::invalid_argument("capability '" + this->name() + "' has no handler");
  }
}

net::awaitable<nlohmann::json> AsyncCapability::invoke(const nlohmann::json& arguments) const {
  co_return co_await handler_(arguments);
}

}  // namespace toolbox::mcp
