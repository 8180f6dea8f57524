// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_registry.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace proximity {
namespace network {

PeerRecord& PeerRegistry::upsert_locked(const PeerId& peer, std::chrono::steady_clock::time_point now,
                                        bool& created) {
  auto [it, inserted] = peers_.try_emplace(peer);
  created = inserted;
  if (inserted) {
    it->second.peer_id = peer;
    it->second.last_seen = now;
  } else {
    it->second.last_seen = std::max(it->second.last_seen, now);
  }
  return it->second;
}

PeerRegistry::ObserveResult PeerRegistry::observe(const PeerId& peer, const std::optional<CapabilitySet>& caps,
                                                  std::chrono::steady_clock::time_point now,
                                                  std::optional<int> rssi, const std::string& local_name) {
  std::lock_guard<std::mutex> lock(mutex_);

  ObserveResult result;
  PeerRecord& record = upsert_locked(peer, now, result.created);

  result.first_advertised = !record.advertised;
  record.advertised = true;

  if (caps && record.capabilities != caps) {
    record.capabilities = caps;
    result.capabilities_changed = true;
  }
  if (rssi) {
    record.rssi = rssi;
  }
  if (!local_name.empty()) {
    record.local_name = local_name;
  }
  return result;
}

void PeerRegistry::set_connection_state(const PeerId& peer, ConnectionState state,
                                        const std::optional<ConnectionHandle>& handle) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Only an attempt or a live link introduces a peer we never scanned
  if (state != ConnectionState::Connecting && state != ConnectionState::Ready && !peers_.count(peer)) {
    return;
  }

  bool created = false;
  PeerRecord& record = upsert_locked(peer, util::GetSteadyTime(), created);
  record.connection_state = state;
  record.connection_handle = handle;
}

std::optional<PeerRecord> PeerRegistry::get(const PeerId& peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for (const auto& [id, record] : peers_) {
    out.push_back(record);
  }
  return out;
}

std::vector<PeerId> PeerRegistry::evict_stale(std::chrono::steady_clock::time_point now,
                                              std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerId> evicted;
  for (auto it = peers_.begin(); it != peers_.end();) {
    const PeerRecord& record = it->second;
    if (record.connection_state == ConnectionState::Disconnected && now - record.last_seen > ttl) {
      if (record.advertised) {
        evicted.push_back(it->first);
      }
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

void PeerRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.clear();
}

}  // namespace network
}  // namespace proximity
