// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/advertisement.hpp"

#include <algorithm>
#include <new>

namespace proximity {
namespace network {

std::vector<uint8_t> AdvertisementCodec::encode(const CapabilitySet& caps, uint16_t service_id) {
  const size_t data_len = std::min(caps.service_data.size(), protocol::MAX_SERVICE_DATA_SIZE);

  std::vector<uint8_t> out;
  out.reserve(protocol::ADVERTISEMENT_HEADER_SIZE + data_len);

  out.push_back(static_cast<uint8_t>(service_id & 0xFF));
  out.push_back(static_cast<uint8_t>((service_id >> 8) & 0xFF));

  uint8_t flags = protocol::CAP_NONE;
  if (caps.payment_capable) {
    flags |= protocol::CAP_PAYMENT;
  }
  out.push_back(flags & protocol::KNOWN_CAPABILITY_FLAGS);

  out.insert(out.end(), caps.service_data.begin(), caps.service_data.begin() + static_cast<std::ptrdiff_t>(data_len));
  return out;
}

std::optional<CapabilitySet> AdvertisementCodec::decode(const uint8_t* data, size_t size,
                                                        uint16_t service_id) noexcept {
  if (data == nullptr || size < protocol::ADVERTISEMENT_HEADER_SIZE) {
    return std::nullopt;
  }
  if (!has_service_prefix(data, size, service_id)) {
    return std::nullopt;
  }

  try {
    CapabilitySet caps;
    const uint8_t flags = data[protocol::SERVICE_ID_SIZE];
    caps.payment_capable = (flags & protocol::CAP_PAYMENT) != 0;

    // Anything past the broadcast limit cannot have come from a conforming encoder
    const size_t available = size - protocol::ADVERTISEMENT_HEADER_SIZE;
    const size_t data_len = std::min(available, protocol::MAX_SERVICE_DATA_SIZE);
    const uint8_t* begin = data + protocol::ADVERTISEMENT_HEADER_SIZE;
    caps.service_data.assign(begin, begin + data_len);
    return caps;
  } catch (const std::bad_alloc&) {
    return std::nullopt;
  }
}

bool AdvertisementCodec::has_service_prefix(const uint8_t* data, size_t size, uint16_t service_id) noexcept {
  if (data == nullptr || size < protocol::SERVICE_ID_SIZE) {
    return false;
  }
  const uint16_t prefix = static_cast<uint16_t>(data[0]) | static_cast<uint16_t>(data[1] << 8);
  return prefix == service_id;
}

}  // namespace network
}  // namespace proximity
