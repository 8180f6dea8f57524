// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/capability.hpp"
#include "network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace proximity {
namespace network {

/**
 * AdvertisementCodec - advertisement payload encoding
 *
 * Layout: [service id: 2 bytes LE][flags: 1 byte][service data: <= 28 bytes]
 *
 * encode() is total: it never fails and never produces more than
 * protocol::MAX_ADVERTISEMENT_SIZE bytes. Flags are always kept; service data
 * is cut at the boundary. Reserved flag bits are written as zero.
 *
 * decode() never throws. It returns nullopt when the prefix does not match
 * the expected service or the buffer cannot hold the flag byte. Reserved flag
 * bits are ignored.
 */
class AdvertisementCodec {
public:
  [[nodiscard]] static std::vector<uint8_t> encode(const CapabilitySet& caps,
                                                   uint16_t service_id = protocol::services::CHAT);

  [[nodiscard]] static std::optional<CapabilitySet> decode(const uint8_t* data, size_t size,
                                                           uint16_t service_id = protocol::services::CHAT) noexcept;

  [[nodiscard]] static std::optional<CapabilitySet> decode(const std::vector<uint8_t>& payload,
                                                           uint16_t service_id = protocol::services::CHAT) noexcept {
    return decode(payload.data(), payload.size(), service_id);
  }

  // True if the buffer starts with the little-endian service id, regardless
  // of whether the rest decodes
  [[nodiscard]] static bool has_service_prefix(const uint8_t* data, size_t size, uint16_t service_id) noexcept;

  [[nodiscard]] static bool has_service_prefix(const std::vector<uint8_t>& payload, uint16_t service_id) noexcept {
    return has_service_prefix(payload.data(), payload.size(), service_id);
  }
};

}  // namespace network
}  // namespace proximity
