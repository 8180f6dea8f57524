// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace proximity {
namespace protocol {

// ============================================================================
// SERVICES AND CHARACTERISTICS
// ============================================================================

// 16-bit service identifiers advertised in the service list and used as the
// advertisement payload prefix (little-endian on the wire)
namespace services {
constexpr uint16_t CHAT = 0x1234;     // Always exposed
constexpr uint16_t PAYMENT = 0x1235;  // Exposed only when payment-capable
}  // namespace services

// Characteristics a peer writes frames into
namespace characteristics {
constexpr uint16_t MESSAGE = 0x2234;  // Chat service
constexpr uint16_t PAYMENT = 0x2235;  // Payment service
}  // namespace characteristics

// ============================================================================
// ADVERTISEMENT WIRE FORMAT
// ============================================================================
// [service id: 2 bytes LE][flags: 1 byte][service data: <= 28 bytes]

constexpr size_t MAX_ADVERTISEMENT_SIZE = 31;  // Legacy broadcast payload limit
constexpr size_t SERVICE_ID_SIZE = 2;
constexpr size_t FLAGS_SIZE = 1;
constexpr size_t ADVERTISEMENT_HEADER_SIZE = SERVICE_ID_SIZE + FLAGS_SIZE;
constexpr size_t MAX_SERVICE_DATA_SIZE = MAX_ADVERTISEMENT_SIZE - ADVERTISEMENT_HEADER_SIZE;  // 28

// Capability flag bits
enum CapabilityFlags : uint8_t {
  CAP_NONE = 0,
  CAP_PAYMENT = (1 << 0),  // Can receive payments
};

// Bits this version understands; the rest are reserved (written as zero, ignored on read)
constexpr uint8_t KNOWN_CAPABILITY_FLAGS = CAP_PAYMENT;

// ============================================================================
// CONNECTION FRAMING
// ============================================================================
// [length: u16 big-endian][payload] split across one or more link writes

constexpr size_t FRAME_HEADER_SIZE = 2;
constexpr size_t MAX_FRAME_SIZE_LIMIT = 0xFFFF;  // Largest length the header can express
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 4096;
constexpr size_t DEFAULT_LINK_MTU = 20;  // Usable write size before MTU negotiation

// ============================================================================
// RESOURCE LIMITS
// ============================================================================

constexpr unsigned int DEFAULT_MAX_INBOUND_LINKS = 4;
constexpr unsigned int DEFAULT_MAX_OUTBOUND_LINKS = 4;
constexpr size_t DEFAULT_MAX_QUEUED_FRAMES = 64;  // Per peer
constexpr size_t DEFAULT_EVENT_QUEUE_CAPACITY = 4096;

// ============================================================================
// TIMEOUTS AND INTERVALS
// ============================================================================

constexpr std::chrono::milliseconds CONNECT_TIMEOUT{10000};
constexpr std::chrono::milliseconds SERVICE_DISCOVERY_TIMEOUT{5000};
constexpr std::chrono::milliseconds DISCONNECT_TIMEOUT{2000};  // Forced cleanup if the link never confirms

// Reconnect backoff for client links lost with a transient reason
constexpr std::chrono::milliseconds RECONNECT_BACKOFF_BASE{500};
constexpr std::chrono::milliseconds RECONNECT_BACKOFF_CAP{30000};
constexpr double RECONNECT_BACKOFF_JITTER = 0.2;
constexpr unsigned int MAX_RECONNECT_ATTEMPTS = 5;

// Scan and advertise start retries
constexpr std::chrono::milliseconds START_RETRY_BASE{250};
constexpr std::chrono::milliseconds START_RETRY_CAP{5000};
constexpr unsigned int MAX_START_ATTEMPTS = 5;

constexpr std::chrono::milliseconds ADVERTISE_RESTART_DEBOUNCE{250};

constexpr std::chrono::seconds STALE_PEER_TTL{60};
constexpr std::chrono::seconds EVICTION_INTERVAL{5};

}  // namespace protocol
}  // namespace proximity
