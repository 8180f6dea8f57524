// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/capability.hpp"
#include "network/connection_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proximity {
namespace network {

// Identifier returned by Engine::send, echoed in FrameSent / SendFailed
using SendId = uint64_t;

// A peer was seen advertising our service for the first time since its
// record was created. capabilities is empty if the payload did not decode.
struct PeerDiscovered {
  PeerId peer;
  std::optional<CapabilitySet> capabilities;
  std::optional<int> rssi;
  std::string local_name;
};

struct PeerCapabilitiesChanged {
  PeerId peer;
  CapabilitySet capabilities;
};

// Record evicted after the staleness timeout
struct PeerWentStale {
  PeerId peer;
};

struct ConnectionStateChanged {
  PeerId peer;
  ConnectionState state{ConnectionState::Disconnected};
  ConnectionRole role{ConnectionRole::Client};
  std::optional<ErrorCode> reason;  // Set on Failed and on unexpected Disconnected
};

struct FrameReceived {
  PeerId peer;
  Channel channel{Channel::Message};
  std::vector<uint8_t> payload;
};

// Last chunk of the frame was acknowledged by the link
struct FrameSent {
  PeerId peer;
  SendId send_id{0};
  Channel channel{Channel::Message};
};

struct SendFailed {
  PeerId peer;
  SendId send_id{0};
  ErrorCode reason{ErrorCode::NotConnected};
};

// An inbound frame was dropped (declared length above the maximum)
struct FrameRejected {
  PeerId peer;
  Channel channel{Channel::Message};
  ErrorCode reason{ErrorCode::FrameTooLarge};
};

struct AdvertiseStarted {};

struct AdvertiseFailed {
  ErrorCode reason{ErrorCode::ResourceExhausted};
};

struct ScanStarted {};

struct ScanFailed {
  ErrorCode reason{ErrorCode::ResourceExhausted};
};

using EngineEvent = std::variant<PeerDiscovered, PeerCapabilitiesChanged, PeerWentStale, ConnectionStateChanged,
                                 FrameReceived, FrameSent, SendFailed, FrameRejected, AdvertiseStarted,
                                 AdvertiseFailed, ScanStarted, ScanFailed>;

// Components report through a sink; the engine owns the queue behind it
using EventSink = std::function<void(EngineEvent)>;

// Short name for logs ("peer-discovered", "frame-received", ...)
std::string EventName(const EngineEvent& event);

}  // namespace network
}  // namespace proximity
