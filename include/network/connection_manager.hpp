// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConnectionManager - per-peer link lifecycle for both roles

 Purpose
 - Client role: connect, discover the remote services, become Ready
 - Server role: accept inbound links up to max_inbound, immediately Ready
 - Keep at most one live link per peer (reuse, supersede, or reject)
 - Frame outbound payloads into MTU-sized writes, reassemble inbound writes
 - Reconnect client links lost with a transient reason

 Per-peer states
   Disconnected -> Connecting -> Discovering -> Ready -> Disconnecting -> Disconnected
   Failed: end of one attempt; back to Disconnected after the reconnect delay
   (or at once when no retry is due)

 Simultaneous connect (both sides dial each other)
 - The side whose local id compares lower keeps its outbound attempt and
   rejects the inbound link; the other side abandons its attempt and accepts
 - Without a local id the inbound link supersedes the outbound attempt
 - An inbound link for a peer that is already Ready is rejected

 Sending
 - One write in flight per peer; frames leave in call order (per-peer FIFO)
 - The outbound queue is bounded (ResourceExhausted when full)
 - Oversize payloads fail with FrameTooLarge before anything is written

 Teardown
 - disconnect() fails queued sends with Cancelled and releases buffers at
   once; the link confirms via on_link_lost or the disconnect timeout fires
 - Link loss fails queued sends with LinkLost
 - Stale callbacks (old link ids, superseded attempts) are ignored

 Threading
 - Every method must be called on the io_context. LinkTransport callbacks
   are posted there by Start().
*/

#include "network/connection_types.hpp"
#include "network/events.hpp"
#include "network/frame_codec.hpp"
#include "network/peer_registry.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "util/backoff.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace proximity {

namespace test {
class ConnectionManagerTestAccess;
}  // namespace test

namespace network {

class ConnectionManager {
public:
  struct Config {
    std::string local_peer_id;  // Tie-break key for simultaneous connects (empty = inbound wins)
    unsigned int max_inbound;
    unsigned int max_outbound;
    size_t max_frame_size;
    size_t max_queued_frames;  // Per peer
    size_t fallback_mtu;       // Write size when the transport reports 0
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds discovery_timeout;
    std::chrono::milliseconds disconnect_timeout;
    util::BackoffPolicy reconnect;
    uint64_t rng_seed;  // 0 = random

    Config()
        : max_inbound(protocol::DEFAULT_MAX_INBOUND_LINKS),
          max_outbound(protocol::DEFAULT_MAX_OUTBOUND_LINKS),
          max_frame_size(protocol::DEFAULT_MAX_FRAME_SIZE),
          max_queued_frames(protocol::DEFAULT_MAX_QUEUED_FRAMES),
          fallback_mtu(protocol::DEFAULT_LINK_MTU),
          connect_timeout(protocol::CONNECT_TIMEOUT),
          discovery_timeout(protocol::SERVICE_DISCOVERY_TIMEOUT),
          disconnect_timeout(protocol::DISCONNECT_TIMEOUT),
          reconnect{protocol::RECONNECT_BACKOFF_BASE, protocol::RECONNECT_BACKOFF_CAP,
                    protocol::RECONNECT_BACKOFF_JITTER, protocol::MAX_RECONNECT_ATTEMPTS},
          rng_seed(0) {}
  };

  ConnectionManager(asio::io_context& io_context, LinkTransportPtr transport, PeerRegistry& registry,
                    EventSink sink, const Config& config = Config{});
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Install transport callbacks
  void Start();

  // Disconnect every peer, cancel all timers. Queued sends fail with Cancelled.
  void Shutdown();

  void connect(const PeerId& peer);
  void disconnect(const PeerId& peer);
  void send(const PeerId& peer, SendId send_id, std::vector<uint8_t> payload, Channel channel = Channel::Message);

  // === Transport event handlers (io_context) ===

  void HandleInboundLink(LinkId link, const PeerId& peer);
  void HandleData(LinkId link, uint16_t characteristic, const std::vector<uint8_t>& chunk);
  void HandleLinkLost(LinkId link, ErrorCode reason);

  // === Queries ===

  [[nodiscard]] ConnectionState get_state(const PeerId& peer) const;
  // Reason of the most recent failed attempt; cleared once the peer is Ready
  [[nodiscard]] std::optional<ErrorCode> last_failure(const PeerId& peer) const;
  [[nodiscard]] std::optional<ConnectionHandle> get_handle(const PeerId& peer) const;
  [[nodiscard]] std::vector<PeerId> connected_peers() const;
  [[nodiscard]] bool remote_exposes_payment(const PeerId& peer) const;

  [[nodiscard]] size_t inbound_count() const;
  [[nodiscard]] size_t outbound_count() const;
  [[nodiscard]] size_t tracked_peer_count() const { return peers_.size(); }

  // Instrumentation: buffers currently allocated across all peers
  [[nodiscard]] size_t live_reassembly_buffers() const;
  [[nodiscard]] size_t live_outbound_queues() const;

  // Forget Disconnected peers with nothing pending (called from maintenance)
  size_t prune_idle();

private:
  friend class test::ConnectionManagerTestAccess;

  struct OutboundFrame {
    SendId send_id{0};
    Channel channel{Channel::Message};
    std::vector<uint8_t> bytes;  // Header + payload
    size_t offset{0};            // Bytes acknowledged
  };

  struct PeerLink {
    PeerId peer;
    ConnectionState state{ConnectionState::Disconnected};
    ConnectionRole role{ConnectionRole::Client};
    LinkId link{INVALID_LINK_ID};
    uint64_t handle_id{0};
    uint64_t epoch{0};  // Bumped per attempt/link; async completions carry it
    bool wanted{false};  // Client intent; cleared by disconnect() and exhausted retries
    bool remote_payment{false};
    std::optional<ErrorCode> last_failure;
    size_t mtu{protocol::DEFAULT_LINK_MTU};

    std::unique_ptr<std::deque<OutboundFrame>> outbound;  // Allocated while Ready
    std::map<Channel, std::unique_ptr<FrameReassembler>> reassemblers;
    bool write_in_flight{false};
    size_t write_len{0};

    std::unique_ptr<asio::steady_timer> timer;  // Connect/discovery/disconnect timeout or reconnect delay
    uint64_t timer_seq{0};
    std::unique_ptr<util::ExponentialBackoff> reconnect_backoff;
  };

  PeerLink& get_or_create(const PeerId& peer);
  PeerLink* find(const PeerId& peer);
  const PeerLink* find(const PeerId& peer) const;
  PeerLink* find_by_link(LinkId link);

  void begin_connect(PeerLink& pl);
  void HandleConnectResult(const PeerId& peer, uint64_t epoch, ErrorCode result);
  void HandleServicesDiscovered(const PeerId& peer, uint64_t epoch, ErrorCode result,
                                const std::vector<ServiceLayout>& services);
  void HandleWriteComplete(const PeerId& peer, uint64_t epoch, ErrorCode result);

  void accept_inbound(PeerLink& pl, LinkId link);
  void become_ready(PeerLink& pl);
  void fail(PeerLink& pl, ErrorCode reason);
  void lose_server_link(PeerLink& pl, ErrorCode reason);
  void finalize_disconnect(PeerLink& pl);

  // Drop the link id mapping; optionally ask the transport to tear it down
  void detach_link(PeerLink& pl, bool disconnect_transport);
  void release_buffers(PeerLink& pl, ErrorCode send_failure);
  void pump(PeerLink& pl);

  void set_state(PeerLink& pl, ConnectionState state, std::optional<ErrorCode> reason = std::nullopt);
  void arm_timer(PeerLink& pl, std::chrono::milliseconds delay, void (ConnectionManager::*on_expiry)(PeerLink&));
  void cancel_timer(PeerLink& pl);

  void on_connect_timeout(PeerLink& pl);
  void on_discovery_timeout(PeerLink& pl);
  void on_disconnect_timeout(PeerLink& pl);
  void on_reconnect_due(PeerLink& pl);

  size_t link_mtu(LinkId link) const;

  static std::optional<Channel> ChannelForCharacteristic(uint16_t characteristic);

  asio::io_context& io_context_;
  LinkTransportPtr transport_;
  PeerRegistry& registry_;
  EventSink sink_;
  Config config_;

  std::unordered_map<PeerId, PeerLink> peers_;
  std::unordered_map<LinkId, PeerId> links_;

  uint64_t next_handle_id_{1};
  uint64_t next_epoch_{1};
  uint64_t backoff_seed_{0};
  bool shutting_down_{false};

  std::shared_ptr<bool> lifetime_;
};

}  // namespace network
}  // namespace proximity
