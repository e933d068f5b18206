#include "transport/observer_connection.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolbox::transport {

ObserverConnection::ObserverConnection(net::any_io_executor strand, const std::uint64_t id,
                                       const std::size_t max_pending)
    : strand_(std::move(strand)), id_(id), max_pending_(max_pending), wakeup_(strand_) {}

bool ObserverConnection::enqueue(const NotificationEvent& event) {
  auto frame = encode_event_frame(event);
  bool overflowed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return false;
    }
    if (queue_.size() >= max_pending_) {
      open_ = false;
      queue_.clear();
      overflowed = true;
    } else {
      queue_.push_back(std::move(frame));
    }
  }
  wake();
  return !overflowed;
}

void ObserverConnection::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return;
    }
    open_ = false;
  }
  wake();
}

bool ObserverConnection::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

std::size_t ObserverConnection::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void ObserverConnection::wake() {
  // The timer belongs to the strand; cancelling from there cannot race the
  // drain loop arming it.
  net::post(strand_, [self = shared_from_this()]() { self->wakeup_.cancel(); });
}

net::awaitable<ObserverConnection::Item> ObserverConnection::next(const std::chrono::steady_clock::duration idle) {
  const auto deadline = std::chrono::steady_clock::now() + idle;

  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!queue_.empty()) {
        Item item{.signal = Signal::kEvent, .frame = std::move(queue_.front())};
        queue_.pop_front();
        co_return item;
      }
      if (!open_) {
        co_return Item{.signal = Signal::kShutdown};
      }
    }

    boost::system::error_code ec;
    wakeup_.expires_at(deadline);
    co_await wakeup_.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (!ec) {
      co_return Item{.signal = Signal::kKeepalive, .frame = std::string(kKeepaliveFrame)};
    }
  }
}

}  // namespace toolbox::transport
