#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "transport/events.hpp"

namespace toolbox::transport {

namespace net = boost::asio;

// Frames an observer may have waiting before it is treated as stalled.
constexpr std::size_t kDefaultMaxPendingEvents = 1024;

// The outbound queue of one open event stream. Any thread may enqueue; only the
// stream's own drain loop, running on the connection's strand, consumes.
class ObserverConnection : public std::enable_shared_from_this<ObserverConnection> {
 public:
  enum class Signal { kEvent, kKeepalive, kShutdown };

  struct Item {
    Signal signal{Signal::kShutdown};
    std::string frame{};
  };

  // The executor must be a strand; next() has to be awaited from it.
  ObserverConnection(net::any_io_executor strand, std::uint64_t id,
                     std::size_t max_pending = kDefaultMaxPendingEvents);

  ObserverConnection(const ObserverConnection&) = delete;
  ObserverConnection& operator=(const ObserverConnection&) = delete;

  // False once the connection is closed; the event is dropped. An event that
  // would exceed max_pending closes the connection and discards its backlog.
  bool enqueue(const NotificationEvent& event);

  // Places the shutdown signal behind anything already queued.
  void close();

  bool is_open() const;
  std::size_t pending() const;
  std::uint64_t id() const noexcept { return id_; }
  const net::any_io_executor& executor() const noexcept { return strand_; }

  // Next queued frame, a keepalive once `idle` passes with nothing queued, or
  // shutdown after the queue is drained on a closed connection.
  net::awaitable<Item> next(std::chrono::steady_clock::duration idle);

 private:
  void wake();

  net::any_io_executor strand_;
  std::uint64_t id_;
  std::size_t max_pending_;
  net::steady_timer wakeup_;
  mutable std::mutex mutex_;
  std::deque<std::string> queue_{};
  bool open_{true};
};

}  // namespace toolbox::transport
