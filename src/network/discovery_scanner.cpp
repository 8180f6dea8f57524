// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/discovery_scanner.hpp"

#include "network/advertisement.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <asio/post.hpp>

namespace proximity {
namespace network {

std::string ScannerStateAsString(DiscoveryScanner::State state) {
  switch (state) {
  case DiscoveryScanner::State::Idle:
    return "idle";
  case DiscoveryScanner::State::Scanning:
    return "scanning";
  default:
    return "unknown";
  }
}

DiscoveryScanner::DiscoveryScanner(asio::io_context& io_context, ScannerPtr scanner, PeerRegistry& registry,
                                   EventSink sink, const Config& config)
    : io_context_(io_context),
      scanner_(std::move(scanner)),
      registry_(registry),
      sink_(std::move(sink)),
      config_(config),
      retry_backoff_(config.start_retry, config.rng_seed),
      retry_timer_(io_context),
      lifetime_(std::make_shared<bool>(true)) {
  if (!scanner_) {
    throw std::invalid_argument("DiscoveryScanner requires a Scanner");
  }
}

DiscoveryScanner::~DiscoveryScanner() {
  retry_timer_.cancel();
  if (platform_active_) {
    scanner_->stop_scan();
  }
}

void DiscoveryScanner::start() {
  if (state_ == State::Scanning) {
    LOG_DISC_TRACE("start ignored, already scanning");
    return;
  }

  state_ = State::Scanning;
  ++generation_;
  retry_backoff_.reset();
  LOG_DISC_DEBUG("scanning for service 0x{:04x}", config_.service_id);
  try_start_platform();
}

void DiscoveryScanner::stop() {
  if (state_ == State::Idle) {
    return;
  }

  state_ = State::Idle;
  ++generation_;
  retry_timer_.cancel();
  if (platform_active_) {
    platform_active_ = false;
    scanner_->stop_scan();
  }
  LOG_DISC_DEBUG("scanning stopped");
}

void DiscoveryScanner::try_start_platform() {
  if (state_ != State::Scanning) {
    return;
  }

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;
  const uint64_t generation = generation_;

  auto on_result = [this, io, alive](const ScanResult& result) {
    asio::post(*io, [this, alive, result]() {
      if (alive.expired()) {
        return;
      }
      try {
        HandleScanResult(result);
      } catch (const std::exception& e) {
        LOG_DISC_ERROR("exception while handling scan result from {}: {}", result.peer_id, e.what());
      }
    });
  };

  auto on_failure = [this, io, alive, generation](ErrorCode reason) {
    asio::post(*io, [this, alive, generation, reason]() {
      if (alive.expired()) {
        return;
      }
      handle_platform_failure(generation, reason);
    });
  };

  if (scanner_->start_scan(config_.service_id, std::move(on_result), std::move(on_failure))) {
    platform_active_ = true;
    LOG_DISC_INFO("scan started");
    sink_(ScanStarted{});
    return;
  }

  LOG_DISC_WARN("platform refused to start scan (attempt {})", retry_backoff_.attempts() + 1);
  schedule_retry(ErrorCode::ResourceExhausted);
}

void DiscoveryScanner::schedule_retry(ErrorCode reason) {
  auto delay = retry_backoff_.next();
  if (!delay) {
    LOG_DISC_ERROR("scan start retries exhausted: {}", ErrorCodeAsString(reason));
    state_ = State::Idle;
    ++generation_;
    sink_(ScanFailed{reason});
    return;
  }

  LOG_DISC_DEBUG("retrying scan start in {}ms", delay->count());
  std::weak_ptr<bool> alive = lifetime_;
  const uint64_t generation = generation_;
  retry_timer_.expires_after(*delay);
  retry_timer_.async_wait([this, alive, generation](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || alive.expired()) {
      return;
    }
    if (generation != generation_) {
      return;
    }
    try_start_platform();
  });
}

void DiscoveryScanner::handle_platform_failure(uint64_t generation, ErrorCode reason) {
  if (generation != generation_ || state_ != State::Scanning) {
    return;
  }

  LOG_DISC_WARN("scan aborted by platform: {}", ErrorCodeAsString(reason));
  if (platform_active_) {
    platform_active_ = false;
    scanner_->stop_scan();
  }
  schedule_retry(reason);
}

bool DiscoveryScanner::matches_service(const ScanResult& result) const {
  const auto& uuids = result.service_uuids;
  if (std::find(uuids.begin(), uuids.end(), config_.service_id) != uuids.end()) {
    return true;
  }
  return AdvertisementCodec::has_service_prefix(result.service_data, config_.service_id);
}

void DiscoveryScanner::HandleScanResult(const ScanResult& result) {
  if (state_ != State::Scanning) {
    return;
  }
  if (result.peer_id.empty()) {
    return;
  }

  // A delivered result proves the platform scan is healthy
  retry_backoff_.reset();

  std::optional<CapabilitySet> caps = AdvertisementCodec::decode(result.service_data, config_.service_id);
  if (!caps && !matches_service(result)) {
    LOG_DISC_TRACE("ignoring advertisement from {} (foreign service)", result.peer_id);
    return;
  }
  if (!caps && !result.service_data.empty()) {
    LOG_DISC_WARN_RL("undecodable advertisement from {} ({} bytes), capabilities unknown", result.peer_id,
                     result.service_data.size());
  }

  auto observed = registry_.observe(result.peer_id, caps, util::GetSteadyTime(), result.rssi, result.local_name);
  auto record = registry_.get(result.peer_id);
  const std::optional<CapabilitySet> known = record ? record->capabilities : caps;

  if (observed.first_advertised) {
    PeerDiscovered event;
    event.peer = result.peer_id;
    event.capabilities = known;
    event.rssi = result.rssi;
    event.local_name = result.local_name;
    LOG_DISC_INFO("discovered peer {} (payment={})", result.peer_id,
                  known ? (known->payment_capable ? "yes" : "no") : "unknown");
    sink_(std::move(event));
  } else if (observed.capabilities_changed && caps) {
    LOG_DISC_DEBUG("capabilities of {} changed (payment={})", result.peer_id, caps->payment_capable);
    sink_(PeerCapabilitiesChanged{result.peer_id, *caps});
  }

  if (sighting_hook_) {
    sighting_hook_(result.peer_id, observed, known);
  }
}

}  // namespace network
}  // namespace proximity
