// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/event_queue.hpp"

#include <type_traits>

namespace proximity {
namespace network {

std::string EventName(const EngineEvent& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PeerDiscovered>) {
          return "peer-discovered";
        } else if constexpr (std::is_same_v<T, PeerCapabilitiesChanged>) {
          return "peer-capabilities-changed";
        } else if constexpr (std::is_same_v<T, PeerWentStale>) {
          return "peer-went-stale";
        } else if constexpr (std::is_same_v<T, ConnectionStateChanged>) {
          return "connection-state-changed";
        } else if constexpr (std::is_same_v<T, FrameReceived>) {
          return "frame-received";
        } else if constexpr (std::is_same_v<T, FrameSent>) {
          return "frame-sent";
        } else if constexpr (std::is_same_v<T, SendFailed>) {
          return "send-failed";
        } else if constexpr (std::is_same_v<T, FrameRejected>) {
          return "frame-rejected";
        } else if constexpr (std::is_same_v<T, AdvertiseStarted>) {
          return "advertise-started";
        } else if constexpr (std::is_same_v<T, AdvertiseFailed>) {
          return "advertise-failed";
        } else if constexpr (std::is_same_v<T, ScanStarted>) {
          return "scan-started";
        } else {
          return "scan-failed";
        }
      },
      event);
}

EventQueue::EventQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventQueue::push(EngineEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      ++total_dropped_;
      return false;
    }
    queue_.push_back(std::move(event));
    ++total_pushed_;
  }
  cv_.notify_one();
  return true;
}

std::optional<EngineEvent> EventQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  EngineEvent event = std::move(queue_.front());
  queue_.pop_front();
  ++total_popped_;
  return event;
}

std::optional<EngineEvent> EventQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stopped_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  EngineEvent event = std::move(queue_.front());
  queue_.pop_front();
  ++total_popped_;
  return event;
}

void EventQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

void EventQueue::restart() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = false;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace network
}  // namespace proximity
