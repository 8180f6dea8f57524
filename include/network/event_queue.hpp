// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/events.hpp"
#include "network/protocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace proximity {
namespace network {

/**
 * EventQueue - bounded multi-consumer queue of engine events
 *
 * Produced from the io_context, consumed by application threads. When full,
 * the oldest events are kept and the new one is dropped and counted.
 * stop() wakes all blocked consumers and makes pop() non-blocking; queued
 * events remain readable and late producers may still push.
 */
class EventQueue {
public:
  explicit EventQueue(size_t capacity = protocol::DEFAULT_EVENT_QUEUE_CAPACITY);

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // False if the queue is full
  bool push(EngineEvent event);

  std::optional<EngineEvent> try_pop();

  // Wait up to timeout for an event. Returns nullopt on timeout or when
  // stopped and drained.
  std::optional<EngineEvent> pop(std::chrono::milliseconds timeout);

  void stop();
  void restart();

  [[nodiscard]] bool is_stopped() const { return stopped_.load(); }
  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t capacity() const { return capacity_; }

  [[nodiscard]] size_t total_pushed() const { return total_pushed_.load(); }
  [[nodiscard]] size_t total_popped() const { return total_popped_.load(); }
  [[nodiscard]] size_t total_dropped() const { return total_dropped_.load(); }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<EngineEvent> queue_;
  size_t capacity_;
  std::atomic<bool> stopped_{false};

  std::atomic<size_t> total_pushed_{0};
  std::atomic<size_t> total_popped_{0};
  std::atomic<size_t> total_dropped_{0};
};

}  // namespace network
}  // namespace proximity
