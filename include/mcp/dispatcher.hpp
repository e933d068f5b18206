#pragma once

#include <iosfwd>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "mcp/registry.hpp"

namespace toolbox::mcp {

class Dispatcher {
 public:
  Dispatcher(const CapabilityRegistry& registry, std::ostream& log, bool verbose = false);

  // Never throws: unknown tools, rejected arguments and capability failures all
  // come back as a Failure outcome.
  net::awaitable<Outcome> dispatch(std::string name, nlohmann::json arguments) const;
  Outcome dispatch_blocking(const std::string& name, const nlohmann::json& arguments) const;

  // {"tools": [...]} straight from the registry; no capability runs.
  nlohmann::json list_tools() const;

  const CapabilityRegistry& registry() const noexcept { return registry_; }

 private:
  const CapabilityRegistry& registry_;
  std::ostream& log_;
  bool verbose_{false};
};

}  // namespace toolbox::mcp
