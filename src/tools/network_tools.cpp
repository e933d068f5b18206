#include "tools/network_tools.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "tools/arguments.hpp"

namespace toolbox::tools {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Result slot for a lookup that may outlive the coroutine that asked for it.
// `wake` is set only while that coroutine is still waiting.
struct PendingLookup {
  std::mutex mutex;
  bool abandoned{false};
  bool resolved{false};
  boost::system::error_code error;
  tcp::resolver::results_type endpoints;
  std::function<void()> wake;
};

// Owned by the waiting coroutine's frame. However the frame ends, the lookup is
// told to stop reporting back.
class LookupWaiter {
 public:
  explicit LookupWaiter(std::shared_ptr<PendingLookup> lookup) : lookup_(std::move(lookup)) {}
  ~LookupWaiter() { abandon(); }

  LookupWaiter(const LookupWaiter&) = delete;
  LookupWaiter& operator=(const LookupWaiter&) = delete;

  bool resolved() const {
    std::lock_guard<std::mutex> lock(lookup_->mutex);
    return lookup_->resolved;
  }

  // Stops listening and hands back whatever arrived in time.
  bool settle(boost::system::error_code& error, tcp::resolver::results_type& endpoints) {
    std::lock_guard<std::mutex> lock(lookup_->mutex);
    lookup_->abandoned = true;
    lookup_->wake = nullptr;
    error = lookup_->error;
    endpoints = std::move(lookup_->endpoints);
    return lookup_->resolved;
  }

 private:
  void abandon() {
    std::lock_guard<std::mutex> lock(lookup_->mutex);
    lookup_->abandoned = true;
    lookup_->wake = nullptr;
  }

  std::shared_ptr<PendingLookup> lookup_;
};

struct ConnectAttempt {
  explicit ConnectAttempt(const net::any_io_executor& executor) : deadline(executor), socket(executor) {}

  net::steady_timer deadline;
  tcp::socket socket;
  bool timed_out{false};
};

bool is_scheme_char(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '-' || c == '.';
}

// Leading and trailing control/space bytes are ignored, as are embedded CRs.
std::string normalize_url(std::string_view url) {
  while (!url.empty() && static_cast<unsigned char>(url.front()) <= 0x20) {
    url.remove_prefix(1);
  }
  while (!url.empty() && static_cast<unsigned char>(url.back()) <= 0x20) {
    url.remove_suffix(1);
  }
  std::string out(url);
  out.erase(std::remove(out.begin(), out.end(), '\r'), out.end());
  return out;
}

nlohmann::json invalid_url(const std::string& reason) {
  return nlohmann::json{{"valid", false}, {"reason", reason}};
}

}  // namespace

SystemResolver::SystemResolver() : pool_(1) {}

void SystemResolver::async_resolve(const std::string& host, const std::string& service, ResolveHandler done) {
  auto resolver = std::make_shared<tcp::resolver>(pool_.get_executor());
  resolver->async_resolve(host, service,
                          [resolver, done = std::move(done)](const boost::system::error_code& ec,
                                                             tcp::resolver::results_type results) {
                            done(ec, std::move(results));
                          });
}

net::awaitable<nlohmann::json> is_port_open(nlohmann::json arguments, HostResolver& resolver,
                                            const std::chrono::milliseconds timeout) {
  const auto host = require_string(arguments, "host");
  const auto port = require_integer(arguments, "port");
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Port must be between 1 and 65535, got " + std::to_string(port));
  }

  const auto executor = co_await net::this_coro::executor;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const nlohmann::json closed{{"open", false}};

  auto wakeup = std::make_shared<net::steady_timer>(executor, deadline);
  auto lookup = std::make_shared<PendingLookup>();
  lookup->wake = [executor, wakeup] { net::post(executor, [wakeup] { wakeup->cancel(); }); };
  LookupWaiter waiter(lookup);

  resolver.async_resolve(host, std::to_string(port),
                         [lookup](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                           std::lock_guard<std::mutex> lock(lookup->mutex);
                           if (lookup->abandoned) {
                             return;
                           }
                           lookup->resolved = true;
                           lookup->error = ec;
                           lookup->endpoints = std::move(results);
                           lookup->wake();
                         });

  boost::system::error_code ec;
  if (!waiter.resolved()) {
    co_await wakeup->async_wait(net::redirect_error(net::use_awaitable, ec));
  }

  tcp::resolver::results_type endpoints;
  if (!waiter.settle(ec, endpoints) || ec || std::chrono::steady_clock::now() >= deadline) {
    co_return closed;
  }

  auto attempt = std::make_shared<ConnectAttempt>(executor);
  attempt->deadline.expires_at(deadline);
  attempt->deadline.async_wait([attempt](const boost::system::error_code& wait_error) {
    if (wait_error) {
      return;
    }
    attempt->timed_out = true;
    boost::system::error_code ignored;
    attempt->socket.close(ignored);
  });

  co_await net::async_connect(attempt->socket, endpoints, net::redirect_error(net::use_awaitable, ec));
  const bool open = !ec && !attempt->timed_out;

  attempt->deadline.cancel();
  boost::system::error_code ignored;
  attempt->socket.close(ignored);

  co_return nlohmann::json{{"open", open}};
}

nlohmann::json validate_url(const nlohmann::json& arguments) {
  const auto raw = require_string(arguments, "url");

  if (raw.find_first_of(" \t\n") != std::string::npos) {
    return invalid_url("URL contains whitespace characters");
  }

  const auto url = normalize_url(raw);

  // A scheme is a leading letter followed by scheme characters up to the first ':'.
  std::string_view rest(url);
  bool has_scheme = false;
  if (const auto colon = url.find(':'); colon != std::string::npos && colon > 0 &&
                                        std::isalpha(static_cast<unsigned char>(url.front())) != 0 &&
                                        std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon),
                                                    is_scheme_char)) {
    has_scheme = true;
    rest.remove_prefix(colon + 1);
  }

  std::string_view authority;
  if (rest.substr(0, 2) == "//") {
    rest.remove_prefix(2);
    authority = rest.substr(0, rest.find_first_of("/?#"));
    const bool has_open = authority.find('[') != std::string_view::npos;
    const bool has_close = authority.find(']') != std::string_view::npos;
    if (has_open != has_close) {
      return invalid_url("URL parsing error: Invalid IPv6 URL");
    }
  }

  if (!has_scheme) {
    return invalid_url("Missing protocol (http:// or https://)");
  }
  if (authority.empty()) {
    return invalid_url("Missing domain name");
  }

  return nlohmann::json{{"valid", true}};
}

}  // namespace toolbox::tools
