// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <vector>

namespace proximity {
namespace network {

// Capabilities a device advertises. Pure data.
struct CapabilitySet {
  bool payment_capable{false};

  // Short opaque blob (e.g. an address hash). Truncated to
  // protocol::MAX_SERVICE_DATA_SIZE when advertised.
  std::vector<uint8_t> service_data;

  bool operator==(const CapabilitySet& other) const {
    return payment_capable == other.payment_capable && service_data == other.service_data;
  }
  bool operator!=(const CapabilitySet& other) const { return !(*this == other); }
};

}  // namespace network
}  // namespace proximity
