// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proximity {
namespace network {

/**
 * Platform abstractions for the radio.
 *
 * A platform port (Android/BlueZ/CoreBluetooth bridge) implements these three
 * interfaces; tests use an in-process simulated medium. Callbacks may be
 * invoked on any thread, synchronously from inside the call or later. The
 * engine marshals every callback onto its io_context before touching state.
 */

// One advertisement as seen by the scanner
struct ScanResult {
  PeerId peer_id;
  std::vector<uint16_t> service_uuids;  // 16-bit service ids in the service list
  std::vector<uint8_t> service_data;    // Raw advertisement payload
  std::optional<int> rssi;
  std::string local_name;
};

// What the local advertiser broadcasts
struct AdvertisingData {
  std::vector<uint16_t> service_uuids;
  std::vector<uint8_t> payload;  // Encoded CapabilitySet, <= 31 bytes
  std::string local_name;
  bool connectable{true};
};

// A service and the characteristics it exposes
struct ServiceLayout {
  uint16_t service{0};
  std::vector<uint16_t> characteristics;

  bool operator==(const ServiceLayout& other) const {
    return service == other.service && characteristics == other.characteristics;
  }
};

class Scanner {
public:
  using ResultCallback = std::function<void(const ScanResult&)>;
  // Asynchronous failure after a successful start (scan aborted by the platform)
  using FailureCallback = std::function<void(ErrorCode)>;

  virtual ~Scanner() = default;

  // Returns false if the scan could not start (resource exhaustion).
  // service_filter is a hint; results may still contain other services.
  virtual bool start_scan(uint16_t service_filter, ResultCallback on_result, FailureCallback on_failure) = 0;
  virtual void stop_scan() = 0;
};

class Advertiser {
public:
  // Success or the reason the broadcast could not start
  using StartCallback = std::function<void(ErrorCode)>;

  virtual ~Advertiser() = default;

  virtual void start_advertising(const AdvertisingData& data, StartCallback on_started) = 0;
  virtual void stop_advertising() = 0;
};

class LinkTransport {
public:
  struct Callbacks {
    // A remote connected to our exposed service
    std::function<void(LinkId, const PeerId&)> on_inbound;
    // A remote wrote a chunk to one of our characteristics
    std::function<void(LinkId, uint16_t characteristic, const std::vector<uint8_t>& chunk)> on_data;
    // Link went away (remote disconnect, supervision timeout, or confirmation of disconnect())
    std::function<void(LinkId, ErrorCode)> on_link_lost;
  };

  using ConnectCallback = std::function<void(ErrorCode)>;
  using DiscoverCallback = std::function<void(ErrorCode, const std::vector<ServiceLayout>&)>;
  using WriteCallback = std::function<void(ErrorCode)>;

  virtual ~LinkTransport() = default;

  virtual void set_callbacks(Callbacks callbacks) = 0;

  // Expose the local services so remotes can connect and write
  virtual bool open_server(const std::vector<ServiceLayout>& services) = 0;
  virtual void close_server() = 0;

  // Start an outbound link. Returns its id (INVALID_LINK_ID if the attempt
  // could not be started); completion arrives through on_connected.
  virtual LinkId connect(const PeerId& peer, ConnectCallback on_connected) = 0;

  virtual void discover_services(LinkId link, DiscoverCallback on_discovered) = 0;

  // Write one chunk (<= mtu(link) bytes) to a characteristic of the remote.
  // Acknowledged through on_written.
  virtual void write(LinkId link, uint16_t characteristic, const std::vector<uint8_t>& chunk,
                     WriteCallback on_written) = 0;

  // Tear the link down (also used to reject an inbound link). Confirmed by on_link_lost.
  virtual void disconnect(LinkId link) = 0;

  // Usable payload bytes per write on this link
  virtual size_t mtu(LinkId link) const = 0;
};

using ScannerPtr = std::shared_ptr<Scanner>;
using AdvertiserPtr = std::shared_ptr<Advertiser>;
using LinkTransportPtr = std::shared_ptr<LinkTransport>;

}  // namespace network
}  // namespace proximity
