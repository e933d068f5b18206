#include "mcp/registry.hpp"

#include <utility>

namespace toolbox::mcp {

void CapabilityRegistry::add(std::unique_ptr<Capability> capability) {
  if (capability == nullptr) {
    throw std::invalid_argument("cannot register a null capability");
  }

  const auto& name = capability->name();
  if (index_.find(name) != index_.end()) {
    throw DuplicateCapabilityError("capability '" + name + "' is already registered");
  }

  index_.emplace(name, capabilities_.size());
  capabilities_.push_back(std::move(capability));
}

void CapabilityRegistry::add_sync(std::string name, std::string description, nlohmann::json input_schema,
                                  SyncHandler handler) {
  add(std::make_unique<SyncCapability>(std::move(name), std::move(description), std::move(input_schema),
                                       std::move(handler)));
}

void CapabilityRegistry::add_async(std::string name, std::string description, nlohmann::json input_schema,
                                   AsyncHandler handler) {
  add(std::make_unique<AsyncCapability>(std::move(name), std::move(description), std::move(input_schema),
                                        std::move(handler)));
}

const Capability& CapabilityRegistry::lookup(const std::string& name) const {
  const auto* capability = find(name);
  if (capability == nullptr) {
    throw CapabilityNotFoundError("capability '" + name + "' is not registered");
  }
  return *capability;
}

const Capability* CapabilityRegistry::find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return capabilities_[it->second].get();
}

nlohmann::json CapabilityRegistry::list_all() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& capability : capabilities_) {
    tools.push_back({{"name", capability->name()},
                     {"description", capability->description()},
                     {"inputSchema", capability->input_schema()}});
  }
  return tools;
}

}  // namespace toolbox::mcp
