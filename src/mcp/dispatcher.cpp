#include "mcp/dispatcher.hpp"

#include <exception>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "core/run_blocking.hpp"

namespace toolbox::mcp {

Dispatcher::Dispatcher(const CapabilityRegistry& registry, std::ostream& log, const bool verbose)
    : registry_(registry), log_(log), verbose_(verbose) {}

net::awaitable<Outcome> Dispatcher::dispatch(std::string name, nlohmann::json arguments) const {
  const auto* capability = registry_.find(name);
  if (capability == nullptr) {
    log_ << "[toolbox] unknown tool '" << name << "'\n";
    co_return Failure{kMethodNotFound, "Tool '" + name + "' not found"};
  }

  if (verbose_) {
    log_ << "[toolbox] calling tool " << name << " arguments=" << arguments.dump() << '\n';
  }

  try {
    auto result = co_await capability->invoke(arguments);
    if (verbose_) {
      log_ << "[toolbox] tool " << name << " executed successfully\n";
    }
    co_return Success{std::move(result)};
  } catch (const std::invalid_argument& ex) {
    log_ << "[toolbox] invalid parameters for " << name << ": " << ex.what() << '\n';
    co_return Failure{kInvalidParams, ex.what()};
  } catch (const std::exception& ex) {
    log_ << "[toolbox] internal error executing " << name << ": " << ex.what() << '\n';
    co_return Failure{kInternalError, std::string("Internal error: ") + ex.what()};
  } catch (...) {
    log_ << "[toolbox] internal error executing " << name << ": unknown exception\n";
    co_return Failure{kInternalError, "Internal error: unknown exception"};
  }
}

Outcome Dispatcher::dispatch_blocking(const std::string& name, const nlohmann::json& arguments) const {
  try {
    return core::run_blocking(dispatch(name, arguments));
  } catch (const std::exception& ex) {
    log_ << "[toolbox] dispatch of " << name << " aborted: " << ex.what() << '\n';
    return Failure{kInternalError, std::string("Internal error: ") + ex.what()};
  }
}

nlohmann::json Dispatcher::list_tools() const { return nlohmann::json{{"tools", registry_.list_all()}}; }

}  // namespace toolbox::mcp
