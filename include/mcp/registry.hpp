#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcp/capability.hpp"

namespace toolbox::mcp {

class DuplicateCapabilityError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class CapabilityNotFoundError : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

// Populated once at startup and read-only afterwards, so lookups take no lock.
class CapabilityRegistry {
 public:
  CapabilityRegistry() = default;

  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;
  CapabilityRegistry(CapabilityRegistry&&) = default;
  CapabilityRegistry& operator=(CapabilityRegistry&&) = default;

  void add(std::unique_ptr<Capability> capability);
  void add_sync(std::string name, std::string description, nlohmann::json input_schema, SyncHandler handler);
  void add_async(std::string name, std::string description, nlohmann::json input_schema, AsyncHandler handler);

  const Capability& lookup(const std::string& name) const;
  const Capability* find(const std::string& name) const;

  // Insertion-ordered [{name, description, inputSchema}, ...].
  nlohmann::json list_all() const;

  std::size_t size() const noexcept { return capabilities_.size(); }
  bool empty() const noexcept { return capabilities_.empty(); }

 private:
  std::vector<std::unique_ptr<Capability>> capabilities_{};
  std::unordered_map<std::string, std::size_t> index_{};
};

}  // namespace toolbox::mcp
