// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AdvertiseController - local server lifecycle

 Purpose
 - Expose the local services (chat service + message characteristic, plus the
   payment service + payment characteristic when payment-capable)
 - Broadcast the encoded CapabilitySet so nearby scanners can find us
 - Restart the broadcast when capabilities change

 State machine
   Stopped -> Starting -> Advertising -> Stopped
 set_capabilities() while Starting/Advertising arms a debounce timer; every
 change re-arms it, so a burst of changes produces one restart. A restart
 requested while a start is still in flight is applied once it completes.
 Start failures are retried with backoff; AdvertiseFailed is emitted after
 the last retry and the controller returns to Stopped.

 stop() closes the local server without touching established links.
*/

#include "network/capability.hpp"
#include "network/events.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "util/backoff.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace proximity {

namespace test {
class AdvertiseControllerTestAccess;
}  // namespace test

namespace network {

class AdvertiseController {
public:
  enum class State {
    Stopped,
    Starting,
    Advertising,
  };

  struct Config {
    std::string local_name;                    // Advertised display name (may be empty)
    std::chrono::milliseconds restart_debounce;
    util::BackoffPolicy start_retry;
    uint64_t rng_seed;  // 0 = random

    Config()
        : restart_debounce(protocol::ADVERTISE_RESTART_DEBOUNCE),
          start_retry{protocol::START_RETRY_BASE, protocol::START_RETRY_CAP, 0.0, protocol::MAX_START_ATTEMPTS},
          rng_seed(0) {}
  };

  AdvertiseController(asio::io_context& io_context, AdvertiserPtr advertiser, LinkTransportPtr transport,
                      EventSink sink, const Config& config = Config{});
  ~AdvertiseController();

  AdvertiseController(const AdvertiseController&) = delete;
  AdvertiseController& operator=(const AdvertiseController&) = delete;

  void start();
  void stop();

  void set_capabilities(const CapabilitySet& caps);
  [[nodiscard]] const CapabilitySet& capabilities() const { return caps_; }

  // Safe from any thread
  [[nodiscard]] State state() const { return state_.load(); }
  [[nodiscard]] bool is_advertising() const { return state_.load() == State::Advertising; }

  // Services exposed for a capability set
  [[nodiscard]] static std::vector<ServiceLayout> ServicesFor(const CapabilitySet& caps);

  // What start() hands to the Advertiser for a capability set
  [[nodiscard]] static AdvertisingData AdvertisingDataFor(const CapabilitySet& caps, const std::string& local_name);

  // Number of platform starts issued (diagnostics/tests)
  [[nodiscard]] uint64_t start_attempts() const { return start_attempts_; }

private:
  friend class test::AdvertiseControllerTestAccess;

  void begin_platform_start();
  void handle_start_result(uint64_t generation, ErrorCode result);
  void schedule_retry(ErrorCode reason);
  void restart();
  void close_server();

  asio::io_context& io_context_;
  AdvertiserPtr advertiser_;
  LinkTransportPtr transport_;
  EventSink sink_;
  Config config_;

  CapabilitySet caps_;
  std::atomic<State> state_{State::Stopped};  // Written on the io_context only
  bool server_open_{false};
  bool restart_pending_{false};
  uint64_t generation_{0};
  uint64_t start_attempts_{0};

  util::ExponentialBackoff retry_backoff_;
  asio::steady_timer retry_timer_;
  asio::steady_timer debounce_timer_;

  std::shared_ptr<bool> lifetime_;
};

std::string AdvertiseStateAsString(AdvertiseController::State state);

}  // namespace network
}  // namespace proximity
