// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/capability.hpp"
#include "network/connection_types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proximity {
namespace network {

// Everything known about one remote device. Readers always get copies.
struct PeerRecord {
  PeerId peer_id;
  std::optional<CapabilitySet> capabilities;  // Last successfully decoded
  std::chrono::steady_clock::time_point last_seen{};
  ConnectionState connection_state{ConnectionState::Disconnected};
  std::optional<ConnectionHandle> connection_handle;
  std::optional<int> rssi;
  std::string local_name;
  bool advertised{false};  // Seen in at least one scan result
};

/**
 * PeerRegistry - table of known peers keyed by device identifier
 *
 * Written from the engine's io_context only; the mutex lets application
 * threads take snapshots concurrently.
 *
 * Invariants:
 * - last_seen never moves backwards for a record
 * - a failed decode never erases previously known capabilities
 * - eviction only removes records in the Disconnected state
 */
class PeerRegistry {
public:
  struct ObserveResult {
    bool created{false};               // Record did not exist before
    bool first_advertised{false};      // First scan sighting of this record
    bool capabilities_changed{false};  // Decoded capabilities differ from the stored ones
  };

  ObserveResult observe(const PeerId& peer, const std::optional<CapabilitySet>& caps,
                        std::chrono::steady_clock::time_point now, std::optional<int> rssi = std::nullopt,
                        const std::string& local_name = {});

  // Updates the record. A missing record is created (last_seen = now) only for
  // Connecting and Ready; other states for unknown peers are ignored.
  void set_connection_state(const PeerId& peer, ConnectionState state,
                            const std::optional<ConnectionHandle>& handle);

  [[nodiscard]] std::optional<PeerRecord> get(const PeerId& peer) const;
  [[nodiscard]] std::vector<PeerRecord> snapshot() const;

  // Remove Disconnected records not seen for longer than ttl. Returns the ids of
  // removed records that were advertised; records only known from connection
  // attempts or inbound links are dropped without being reported.
  std::vector<PeerId> evict_stale(std::chrono::steady_clock::time_point now, std::chrono::milliseconds ttl);

  [[nodiscard]] size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::unordered_map<PeerId, PeerRecord> peers_;

  // Caller holds mutex_
  PeerRecord& upsert_locked(const PeerId& peer, std::chrono::steady_clock::time_point now, bool& created);
};

}  // namespace network
}  // namespace proximity
