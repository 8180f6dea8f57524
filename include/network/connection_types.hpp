// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Shared vocabulary types for links, connections and errors

#pragma once

#include <cstdint>
#include <string>

namespace proximity {
namespace network {

// Opaque stable identifier of a remote device (link-layer address string,
// e.g. "AA:BB:CC:DD:EE:01")
using PeerId = std::string;

// Identifier the link transport assigns to one physical link. Never reused
// within a transport's lifetime.
using LinkId = uint64_t;
constexpr LinkId INVALID_LINK_ID = 0;

/**
 * Error taxonomy carried in events and platform callbacks.
 *
 * Transient: LinkTimeout, LinkLost, ResourceExhausted (retried with backoff).
 * Structural: ServiceNotFound, FrameTooLarge, NotConnected (surfaced at once).
 * MalformedAdvertisement is never surfaced; the peer's capabilities are
 * treated as unknown instead.
 */
enum class ErrorCode {
  Success,
  LinkTimeout,
  ServiceNotFound,
  LinkLost,
  ResourceExhausted,
  FrameTooLarge,
  MalformedAdvertisement,
  NotConnected,
  Cancelled,
};

/**
 * Per-peer connection lifecycle.
 *
 * Disconnected -> Connecting -> Discovering -> Ready -> Disconnecting -> Disconnected
 * Failed is terminal for one attempt and returns to Disconnected after a
 * backoff delay.
 */
enum class ConnectionState {
  Disconnected,
  Connecting,
  Discovering,
  Ready,
  Disconnecting,
  Failed,
};

// Which side opened the link
enum class ConnectionRole {
  Server,  // Remote connected to our exposed service
  Client,  // We connected to the remote
};

// Logical channel of a frame; each maps to one characteristic
enum class Channel {
  Message,
  Payment,
};

// Handle to one established logical connection. At most one per peer.
struct ConnectionHandle {
  uint64_t id{0};
  ConnectionRole role{ConnectionRole::Client};
  LinkId link{INVALID_LINK_ID};

  bool operator==(const ConnectionHandle& other) const {
    return id == other.id && role == other.role && link == other.link;
  }
};

std::string ErrorCodeAsString(ErrorCode code);
std::string ConnectionStateAsString(ConnectionState state);
std::string ConnectionRoleAsString(ConnectionRole role);
std::string ChannelAsString(Channel channel);

// Characteristic a channel is written to
uint16_t ChannelCharacteristic(Channel channel);

// True for the errors that warrant an automatic reconnect
inline bool IsTransientError(ErrorCode code) {
  return code == ErrorCode::LinkTimeout || code == ErrorCode::LinkLost || code == ErrorCode::ResourceExhausted;
}

// True while the connection manager owns an attempt or link for the peer
inline bool IsActiveState(ConnectionState state) {
  return state == ConnectionState::Connecting || state == ConnectionState::Discovering ||
         state == ConnectionState::Ready;
}

}  // namespace network
}  // namespace proximity
