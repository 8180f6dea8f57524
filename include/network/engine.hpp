// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/advertise_controller.hpp"
#include "network/capability.hpp"
#include "network/connection_manager.hpp"
#include "network/discovery_scanner.hpp"
#include "network/event_queue.hpp"
#include "network/events.hpp"
#include "network/peer_registry.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace proximity {

namespace test {
class EngineTestAccess;
}  // namespace test

namespace network {

// Engine - top-level proximity engine
// Owns the io_context (or borrows one), PeerRegistry, DiscoveryScanner,
// AdvertiseController and ConnectionManager, and funnels their events into a
// single EventQueue.
//
//   Single-threaded reactor:
// - All component state is touched only on the io_context
// - Public operations post onto the io_context and return at once
// - Config::io_threads MUST be 1 in production (0 = external io_context for tests,
//   driven by the caller)
// - peers(), get_peer(), connected_peers(), is_advertising(), is_scanning() and the
//   event queue are safe from any thread
class Engine {
public:
  struct Config {
    size_t io_threads;           // 1 in production, 0 = external io_context
    std::string local_peer_id;   // Own link-layer id; tie-breaks simultaneous connects
    std::string local_name;      // Advertised display name
    std::string log_level;       // Applied on start() when non-empty
    bool auto_connect_payment_capable;  // Connect to payment-capable peers as they are discovered

    std::chrono::milliseconds stale_ttl;          // Evict Disconnected peers unseen this long
    std::chrono::milliseconds eviction_interval;  // Maintenance period
    size_t event_queue_capacity;

    ConnectionManager::Config connection;
    DiscoveryScanner::Config discovery;
    AdvertiseController::Config advertise;

    Config()
        : io_threads(1),
          auto_connect_payment_capable(false),
          stale_ttl(protocol::STALE_PEER_TTL),
          eviction_interval(protocol::EVICTION_INTERVAL),
          event_queue_capacity(protocol::DEFAULT_EVENT_QUEUE_CAPACITY) {}
  };

  // Platform services the engine drives
  struct Platform {
    ScannerPtr scanner;
    AdvertiserPtr advertiser;
    LinkTransportPtr transport;
  };

  // Throws std::invalid_argument for an invalid config or a missing platform service.
  explicit Engine(Platform platform, const Config& config = Config{},
                  std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Lifecycle
  bool start();

  /**
   * Stop the engine: stop advertising and scanning, close the local server,
   * disconnect every peer (queued sends fail with Cancelled), then stop the
   * io threads. Idempotent. With an external io_context the cleanup runs
   * synchronously on the calling thread, which must be the one driving it.
   */
  void stop();

  bool is_running() const { return running_; }

  // === Operations (asynchronous, completed through events) ===

  void set_local_capabilities(const CapabilitySet& caps);
  void start_discovery();
  void stop_discovery();
  void start_advertising();
  void stop_advertising();
  void connect(const PeerId& peer);
  void disconnect(const PeerId& peer);

  // Returns the id echoed in FrameSent / SendFailed
  SendId send(const PeerId& peer, std::vector<uint8_t> payload, Channel channel = Channel::Message);

  // === Events ===

  EventQueue& events() { return events_; }
  std::optional<EngineEvent> poll_event() { return events_.try_pop(); }
  std::optional<EngineEvent> next_event(std::chrono::milliseconds timeout) { return events_.pop(timeout); }

  // === Queries (thread-safe) ===

  std::vector<PeerRecord> peers() const { return registry_.snapshot(); }
  std::optional<PeerRecord> get_peer(const PeerId& peer) const { return registry_.get(peer); }
  std::vector<PeerId> connected_peers() const;
  CapabilitySet local_capabilities() const;

  // Advertising once the platform confirmed the start. Scanning from
  // start_discovery() until stopped or start retries run out.
  bool is_advertising() const { return advertiser_->is_advertising(); }
  bool is_scanning() const { return scanner_->is_scanning(); }

  const Config& config() const { return config_; }
  asio::io_context& io_context() { return *io_context_; }

  // Test-only: run one maintenance pass (eviction) on the io_context
  // This method is intentionally public but should only be used in tests
  void test_hook_run_maintenance();

private:
  friend class test::EngineTestAccess;

  void handle_event(EngineEvent event);
  void maybe_auto_connect(const PeerId& peer, const std::optional<CapabilitySet>& caps);

  // Runs on the io_context; shared by stop() in both io modes
  void shutdown_components();

  void run_maintenance();
  void schedule_next_maintenance();

  // Post fn onto the io_context, dropped if the engine is gone
  template <typename Fn>
  void post(Fn&& fn);

  Config config_;
  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;

  std::shared_ptr<asio::io_context> io_context_;
  bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  Platform platform_;

  EventQueue events_;
  PeerRegistry registry_;
  std::unique_ptr<DiscoveryScanner> scanner_;
  std::unique_ptr<AdvertiseController> advertiser_;
  std::unique_ptr<ConnectionManager> connections_;

  std::unique_ptr<asio::steady_timer> maintenance_timer_;

  mutable std::mutex caps_mutex_;
  CapabilitySet local_caps_;

  std::atomic<SendId> next_send_id_{1};

  std::shared_ptr<bool> lifetime_;
};

}  // namespace network
}  // namespace proximity
