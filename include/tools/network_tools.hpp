#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

namespace toolbox::tools {

using ResolveHandler =
    std::function<void(const boost::system::error_code&, boost::asio::ip::tcp::resolver::results_type)>;

// Name lookup that runs away from the caller's executor. getaddrinfo cannot be
// interrupted, so a caller that gives up simply stops listening; the lookup
// finishes here on its own.
class HostResolver {
 public:
  virtual ~HostResolver() = default;

  // `done` runs exactly once, on a thread of the resolver's choosing.
  virtual void async_resolve(const std::string& host, const std::string& service, ResolveHandler done) = 0;
};

// getaddrinfo on a private one-thread pool.
class SystemResolver final : public HostResolver {
 public:
  SystemResolver();

  void async_resolve(const std::string& host, const std::string& service, ResolveHandler done) override;

 private:
  boost::asio::thread_pool pool_;
};

// {"host": string, "port": integer} -> {"open": bool}. Resolution and connect
// share one deadline; a timeout, refusal or resolution failure yields
// {"open": false}. Only a bad port argument is an error.
boost::asio::awaitable<nlohmann::json> is_port_open(nlohmann::json arguments, HostResolver& resolver,
                                                    std::chrono::milliseconds timeout);

// {"url": string} -> {"valid": true} or {"valid": false, "reason": string}
nlohmann::json validate_url(const nlohmann::json& arguments);

}  // namespace toolbox::tools
