// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_types.hpp"

#include "network/protocol.hpp"

namespace proximity {
namespace network {

std::string ErrorCodeAsString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "success";
  case ErrorCode::LinkTimeout:
    return "link-timeout";
  case ErrorCode::ServiceNotFound:
    return "service-not-found";
  case ErrorCode::LinkLost:
    return "link-lost";
  case ErrorCode::ResourceExhausted:
    return "resource-exhausted";
  case ErrorCode::FrameTooLarge:
    return "frame-too-large";
  case ErrorCode::MalformedAdvertisement:
    return "malformed-advertisement";
  case ErrorCode::NotConnected:
    return "not-connected";
  case ErrorCode::Cancelled:
    return "cancelled";
  default:
    return "unknown";
  }
}

std::string ConnectionStateAsString(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Discovering:
    return "discovering";
  case ConnectionState::Ready:
    return "ready";
  case ConnectionState::Disconnecting:
    return "disconnecting";
  case ConnectionState::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

std::string ConnectionRoleAsString(ConnectionRole role) {
  switch (role) {
  case ConnectionRole::Server:
    return "server";
  case ConnectionRole::Client:
    return "client";
  default:
    return "unknown";
  }
}

std::string ChannelAsString(Channel channel) {
  switch (channel) {
  case Channel::Message:
    return "message";
  case Channel::Payment:
    return "payment";
  default:
    return "unknown";
  }
}

uint16_t ChannelCharacteristic(Channel channel) {
  return channel == Channel::Payment ? protocol::characteristics::PAYMENT : protocol::characteristics::MESSAGE;
}

}  // namespace network
}  // namespace proximity
