// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/advertise_controller.hpp"

#include "network/advertisement.hpp"
#include "util/logging.hpp"

#include <stdexcept>

#include <asio/post.hpp>

namespace proximity {
namespace network {

std::string AdvertiseStateAsString(AdvertiseController::State state) {
  switch (state) {
  case AdvertiseController::State::Stopped:
    return "stopped";
  case AdvertiseController::State::Starting:
    return "starting";
  case AdvertiseController::State::Advertising:
    return "advertising";
  default:
    return "unknown";
  }
}

AdvertiseController::AdvertiseController(asio::io_context& io_context, AdvertiserPtr advertiser,
                                         LinkTransportPtr transport, EventSink sink, const Config& config)
    : io_context_(io_context),
      advertiser_(std::move(advertiser)),
      transport_(std::move(transport)),
      sink_(std::move(sink)),
      config_(config),
      retry_backoff_(config.start_retry, config.rng_seed),
      retry_timer_(io_context),
      debounce_timer_(io_context),
      lifetime_(std::make_shared<bool>(true)) {
  if (!advertiser_ || !transport_) {
    throw std::invalid_argument("AdvertiseController requires an Advertiser and a LinkTransport");
  }
}

AdvertiseController::~AdvertiseController() {
  retry_timer_.cancel();
  debounce_timer_.cancel();
}

std::vector<ServiceLayout> AdvertiseController::ServicesFor(const CapabilitySet& caps) {
  std::vector<ServiceLayout> services;
  services.push_back({protocol::services::CHAT, {protocol::characteristics::MESSAGE}});
  if (caps.payment_capable) {
    services.push_back({protocol::services::PAYMENT, {protocol::characteristics::PAYMENT}});
  }
  return services;
}

AdvertisingData AdvertiseController::AdvertisingDataFor(const CapabilitySet& caps, const std::string& local_name) {
  AdvertisingData data;
  data.service_uuids.push_back(protocol::services::CHAT);
  if (caps.payment_capable) {
    data.service_uuids.push_back(protocol::services::PAYMENT);
  }
  data.payload = AdvertisementCodec::encode(caps, protocol::services::CHAT);
  data.local_name = local_name;
  data.connectable = true;
  return data;
}

void AdvertiseController::start() {
  if (state_ != State::Stopped) {
    return;
  }

  state_ = State::Starting;
  ++generation_;
  restart_pending_ = false;
  retry_backoff_.reset();
  begin_platform_start();
}

void AdvertiseController::stop() {
  if (state_ == State::Stopped) {
    return;
  }

  const bool was_advertising = state_ == State::Advertising;
  state_ = State::Stopped;
  ++generation_;
  restart_pending_ = false;
  retry_timer_.cancel();
  debounce_timer_.cancel();

  if (was_advertising) {
    advertiser_->stop_advertising();
  }
  close_server();
  LOG_ADV_INFO("advertising stopped");
}

void AdvertiseController::set_capabilities(const CapabilitySet& caps) {
  if (caps == caps_) {
    return;
  }
  caps_ = caps;

  if (state_ == State::Stopped) {
    return;
  }

  // Re-arming cancels the previous wait, so a burst of changes restarts once
  std::weak_ptr<bool> alive = lifetime_;
  debounce_timer_.expires_after(config_.restart_debounce);
  debounce_timer_.async_wait([this, alive](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || alive.expired()) {
      return;
    }
    restart();
  });
  LOG_ADV_DEBUG("capabilities changed, restart in {}ms", config_.restart_debounce.count());
}

void AdvertiseController::restart() {
  if (state_ == State::Stopped) {
    return;
  }
  if (state_ == State::Starting) {
    restart_pending_ = true;
    return;
  }

  LOG_ADV_DEBUG("restarting advertisement with new capabilities");
  advertiser_->stop_advertising();
  state_ = State::Starting;
  ++generation_;
  restart_pending_ = false;
  retry_backoff_.reset();
  begin_platform_start();
}

void AdvertiseController::close_server() {
  if (server_open_) {
    transport_->close_server();
    server_open_ = false;
  }
}

void AdvertiseController::begin_platform_start() {
  if (state_ != State::Starting) {
    return;
  }

  ++start_attempts_;

  // Reopen so the exposed characteristics follow the current capabilities
  close_server();
  if (!transport_->open_server(ServicesFor(caps_))) {
    LOG_ADV_WARN("could not open local service");
    schedule_retry(ErrorCode::ResourceExhausted);
    return;
  }
  server_open_ = true;

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;
  const uint64_t generation = generation_;
  advertiser_->start_advertising(AdvertisingDataFor(caps_, config_.local_name),
                                 [this, io, alive, generation](ErrorCode result) {
                                   asio::post(*io, [this, alive, generation, result]() {
                                     if (alive.expired()) {
                                       return;
                                     }
                                     handle_start_result(generation, result);
                                   });
                                 });
}

void AdvertiseController::handle_start_result(uint64_t generation, ErrorCode result) {
  if (generation != generation_ || state_ != State::Starting) {
    // Superseded by stop() or a restart; a late success must not leave the radio on
    if (result == ErrorCode::Success && state_ == State::Stopped) {
      advertiser_->stop_advertising();
    }
    return;
  }

  if (result != ErrorCode::Success) {
    LOG_ADV_WARN("advertise start failed: {}", ErrorCodeAsString(result));
    schedule_retry(result);
    return;
  }

  state_ = State::Advertising;
  retry_backoff_.reset();
  LOG_ADV_INFO("advertising (payment={}, {} bytes service data)", caps_.payment_capable,
               caps_.service_data.size());
  sink_(AdvertiseStarted{});

  if (restart_pending_) {
    restart_pending_ = false;
    restart();
  }
}

void AdvertiseController::schedule_retry(ErrorCode reason) {
  auto delay = retry_backoff_.next();
  if (!delay) {
    LOG_ADV_ERROR("advertise start retries exhausted: {}", ErrorCodeAsString(reason));
    state_ = State::Stopped;
    ++generation_;
    restart_pending_ = false;
    debounce_timer_.cancel();
    close_server();
    sink_(AdvertiseFailed{reason});
    return;
  }

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
    begin_platform_start();
  });
}

}  // namespace network
}  // namespace proximity
