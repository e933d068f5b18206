#include "transport/connection_registry.hpp"

#include <algorithm>
#include <utility>

namespace toolbox::transport {

void ConnectionRegistry::add(std::shared_ptr<ObserverConnection> connection) {
  if (connection == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.push_back(std::move(connection));
}

bool ConnectionRegistry::remove(const std::shared_ptr<ObserverConnection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find(connections_.begin(), connections_.end(), connection);
  if (it == connections_.end()) {
    return false;
  }
  connections_.erase(it);
  return true;
}

std::size_t ConnectionRegistry::broadcast(const NotificationEvent& event) {
  std::size_t delivered = 0;
  std::vector<std::shared_ptr<ObserverConnection>> refused;
  for (auto& connection : snapshot()) {
    if (connection->enqueue(event)) {
      ++delivered;
    } else {
      refused.push_back(std::move(connection));
    }
  }

  if (!refused.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(connections_, [&refused](const auto& connection) {
      return std::find(refused.begin(), refused.end(), connection) != refused.end();
    });
  }
  return delivered;
}

void ConnectionRegistry::close_all() {
  std::vector<std::shared_ptr<ObserverConnection>> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closing.swap(connections_);
  }
  for (const auto& connection : closing) {
    connection->close();
  }
}

std::size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::shared_ptr<ObserverConnection>> ConnectionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_;
}

}  // namespace toolbox::transport
