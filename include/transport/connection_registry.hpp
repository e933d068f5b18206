#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "transport/events.hpp"
#include "transport/observer_connection.hpp"

namespace toolbox::transport {

// The set of open event streams. Broadcast enqueues into a snapshot, so a slow
// consumer never holds the lock and connects or disconnects mid-broadcast are safe.
class ConnectionRegistry {
 public:
  void add(std::shared_ptr<ObserverConnection> connection);
  bool remove(const std::shared_ptr<ObserverConnection>& connection);

  // Number of connections the event was queued on. A connection that refuses
  // the event, closed or overflowed, is dropped from the registry.
  std::size_t broadcast(const NotificationEvent& event);

  // Signals shutdown to every connection and empties the registry.
  void close_all();

  std::size_t size() const;

 private:
  std::vector<std::shared_ptr<ObserverConnection>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ObserverConnection>> connections_{};
};

}  // namespace toolbox::transport
