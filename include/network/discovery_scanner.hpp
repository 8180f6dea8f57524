// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 DiscoveryScanner - turns raw scan results into peer discovery events

 Purpose
 - Drive the platform Scanner (start/stop, retry on start failure)
 - Filter advertisements by service id, decode capabilities
 - Feed PeerRegistry and emit PeerDiscovered / PeerCapabilitiesChanged

 State machine
   Idle -> Scanning -> Idle
 start() while Scanning is a no-op; stop() is always available. A failed
 platform start (or an asynchronous abort reported after start) is retried
 with exponential backoff while the scanner stays in Scanning. ScanFailed is
 emitted once retries are exhausted and the scanner returns to Idle.

 Deduplication
 - PeerDiscovered: once per registry record (first advertised sighting)
 - PeerCapabilitiesChanged: only when decoded capabilities differ
 - Every accepted sighting (including repeats) reaches the sighting hook,
   after the registry update and any event
 - Advertisements that carry our service but fail to decode keep the last
   known capabilities

 Threading
 - All methods must be called on the io_context, except state() and
   is_scanning()
 - Scanner callbacks may arrive on any thread and are posted to the io_context
*/

#include "network/events.hpp"
#include "network/peer_registry.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "util/backoff.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace proximity {

namespace test {
class DiscoveryScannerTestAccess;
}  // namespace test

namespace network {

class DiscoveryScanner {
public:
  enum class State {
    Idle,
    Scanning,
  };

  struct Config {
    uint16_t service_id;            // Service to filter for
    util::BackoffPolicy start_retry;  // Retry policy for platform start failures
    uint64_t rng_seed;              // 0 = random

    Config()
        : service_id(protocol::services::CHAT),
          start_retry{protocol::START_RETRY_BASE, protocol::START_RETRY_CAP, 0.0, protocol::MAX_START_ATTEMPTS},
          rng_seed(0) {}
  };

  // Peer, what the registry saw, and the last known good capabilities
  using SightingHook = std::function<void(const PeerId&, const PeerRegistry::ObserveResult&,
                                          const std::optional<CapabilitySet>&)>;

  DiscoveryScanner(asio::io_context& io_context, ScannerPtr scanner, PeerRegistry& registry, EventSink sink,
                   const Config& config = Config{});
  ~DiscoveryScanner();

  DiscoveryScanner(const DiscoveryScanner&) = delete;
  DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

  void start();
  void stop();

  void set_sighting_hook(SightingHook hook) { sighting_hook_ = std::move(hook); }

  // Safe from any thread
  [[nodiscard]] State state() const { return state_.load(); }
  [[nodiscard]] bool is_scanning() const { return state_.load() == State::Scanning; }

  // Scan result entry point (io_context). Public so platform ports that
  // already run on the io_context can skip the post.
  void HandleScanResult(const ScanResult& result);

private:
  friend class test::DiscoveryScannerTestAccess;

  void try_start_platform();
  void schedule_retry(ErrorCode reason);
  void handle_platform_failure(uint64_t generation, ErrorCode reason);

  bool matches_service(const ScanResult& result) const;

  asio::io_context& io_context_;
  ScannerPtr scanner_;
  PeerRegistry& registry_;
  EventSink sink_;
  SightingHook sighting_hook_;
  Config config_;

  std::atomic<State> state_{State::Idle};  // Written on the io_context only
  bool platform_active_{false};  // Platform scan currently running
  uint64_t generation_{0};       // Bumped on every start/stop; stale callbacks compare against it
  util::ExponentialBackoff retry_backoff_;
  asio::steady_timer retry_timer_;

  // Guards posted callbacks against running after destruction
  std::shared_ptr<bool> lifetime_;
};

std::string ScannerStateAsString(DiscoveryScanner::State state);

}  // namespace network
}  // namespace proximity
