#pragma once

#include <chrono>
#include <memory>

#include "mcp/registry.hpp"
#include "tools/network_tools.hpp"

namespace toolbox::tools {

struct ToolOptions {
  std::chrono::milliseconds port_check_timeout{3000};
  // Shared by every is_port_open call; a SystemResolver when left empty.
  std::shared_ptr<HostResolver> resolver{};
};

// The six shipped tools, registered in their advertised order.
mcp::CapabilityRegistry build_tool_registry(const ToolOptions& options = {});

}  // namespace toolbox::tools
