// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/engine.hpp"

#include "network/engine_config.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include <asio/post.hpp>

namespace proximity {
namespace network {

template <typename Fn>
void Engine::post(Fn&& fn) {
  std::weak_ptr<bool> alive = lifetime_;
  asio::post(*io_context_, [this, alive, fn = std::forward<Fn>(fn)]() mutable {
    if (alive.expired() || !running_.load(std::memory_order_acquire)) {
      return;
    }
    fn();
  });
}

Engine::Engine(Platform platform, const Config& config, std::shared_ptr<asio::io_context> external_io_context)
    : config_(config),
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      platform_(std::move(platform)),
      events_(config.event_queue_capacity),
      lifetime_(std::make_shared<bool>(true)) {
  if (auto error = ValidateEngineConfig(config_)) {
    throw std::invalid_argument("invalid engine config: " + *error);
  }
  if (!platform_.scanner || !platform_.advertiser || !platform_.transport) {
    throw std::invalid_argument("Engine requires a Scanner, an Advertiser and a LinkTransport");
  }
  if (external_io_context_ && config_.io_threads != 0) {
    throw std::invalid_argument("io_threads must be 0 with an external io_context");
  }

  // Top-level identity flows into the components
  config_.connection.local_peer_id = config_.local_peer_id;
  config_.advertise.local_name = config_.local_name;

  EventSink sink = [this](EngineEvent event) { handle_event(std::move(event)); };

  scanner_ = std::make_unique<DiscoveryScanner>(*io_context_, platform_.scanner, registry_, sink, config_.discovery);
  advertiser_ = std::make_unique<AdvertiseController>(*io_context_, platform_.advertiser, platform_.transport, sink,
                                                      config_.advertise);
  connections_ = std::make_unique<ConnectionManager>(*io_context_, platform_.transport, registry_, sink,
                                                     config_.connection);

  // Auto-connect is re-evaluated on every sighting, not only on discovery
  scanner_->set_sighting_hook(
      [this](const PeerId& peer, const PeerRegistry::ObserveResult&, const std::optional<CapabilitySet>& caps) {
        maybe_auto_connect(peer, caps);
      });

  LOG_ENGINE_DEBUG("engine created (local id '{}', io_threads {})", config_.local_peer_id, config_.io_threads);
}

Engine::~Engine() {
  try {
    stop();
  } catch (const std::exception& e) {
    LOG_ENGINE_ERROR("exception while stopping engine: {}", e.what());
  }
}

bool Engine::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (!config_.log_level.empty()) {
    util::LogManager::Initialize(config_.log_level);
    util::LogManager::SetLogLevel(config_.log_level);
  }

  events_.restart();
  connections_->Start();
  running_.store(true, std::memory_order_release);

  if (config_.io_threads > 0 && !external_io_context_) {
    maintenance_timer_ = std::make_unique<asio::steady_timer>(*io_context_);
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));

    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }

    post([this]() { schedule_next_maintenance(); });
  }

  LOG_ENGINE_INFO("engine started");
  return true;
}

void Engine::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  const bool on_io_thread = io_context_->get_executor().running_in_this_thread();
  if (external_io_context_ || io_threads_.empty() || on_io_thread) {
    shutdown_components();
    running_.store(false, std::memory_order_release);
  } else {
    // Cleanup must run on the reactor thread
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(*io_context_, [this, &done]() {
      try {
        shutdown_components();
      } catch (const std::exception& e) {
        LOG_ENGINE_ERROR("exception during shutdown: {}", e.what());
      }
      done.set_value();
    });
    finished.wait();
    running_.store(false, std::memory_order_release);
  }

  if (!external_io_context_) {
    if (work_guard_) {
      work_guard_.reset();
    }
    io_context_->stop();
    for (auto& thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();
    io_context_->restart();
    // Run what the reactor left queued; guarded work is dropped, pending sends are cancelled
    io_context_->poll();
    io_context_->restart();
  }

  // Wake blocked consumers; queued events stay readable
  events_.stop();
  LOG_ENGINE_INFO("engine stopped");
}

void Engine::shutdown_components() {
  if (maintenance_timer_) {
    maintenance_timer_->cancel();
  }
  advertiser_->stop();
  scanner_->stop();
  connections_->Shutdown();
}

// ============================================================================
// Operations
// ============================================================================

void Engine::set_local_capabilities(const CapabilitySet& caps) {
  {
    std::lock_guard<std::mutex> lock(caps_mutex_);
    local_caps_ = caps;
  }
  post([this, caps]() { advertiser_->set_capabilities(caps); });
}

CapabilitySet Engine::local_capabilities() const {
  std::lock_guard<std::mutex> lock(caps_mutex_);
  return local_caps_;
}

void Engine::start_discovery() {
  post([this]() { scanner_->start(); });
}

void Engine::stop_discovery() {
  post([this]() { scanner_->stop(); });
}

void Engine::start_advertising() {
  post([this]() { advertiser_->start(); });
}

void Engine::stop_advertising() {
  post([this]() { advertiser_->stop(); });
}

void Engine::connect(const PeerId& peer) {
  post([this, peer]() { connections_->connect(peer); });
}

void Engine::disconnect(const PeerId& peer) {
  post([this, peer]() { connections_->disconnect(peer); });
}

SendId Engine::send(const PeerId& peer, std::vector<uint8_t> payload, Channel channel) {
  const SendId id = next_send_id_.fetch_add(1);
  if (!running_.load(std::memory_order_acquire)) {
    events_.push(SendFailed{peer, id, ErrorCode::NotConnected});
    return id;
  }
  // Every SendId resolves: a send still queued when the engine stops is cancelled
  std::weak_ptr<bool> alive = lifetime_;
  asio::post(*io_context_, [this, alive, peer, id, payload = std::move(payload), channel]() mutable {
    if (alive.expired()) {
      return;
    }
    if (!running_.load(std::memory_order_acquire)) {
      events_.push(SendFailed{peer, id, ErrorCode::Cancelled});
      return;
    }
    connections_->send(peer, id, std::move(payload), channel);
  });
  return id;
}

std::vector<PeerId> Engine::connected_peers() const {
  std::vector<PeerId> out;
  for (const auto& record : registry_.snapshot()) {
    if (record.connection_state == ConnectionState::Ready) {
      out.push_back(record.peer_id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

// ============================================================================
// Events and maintenance
// ============================================================================

void Engine::handle_event(EngineEvent event) {
  LOG_ENGINE_DEBUG("event: {}", EventName(event));
  if (!events_.push(std::move(event))) {
    LOG_WARN_RL("event queue full ({} events), dropping newest", events_.capacity());
  }
}

void Engine::maybe_auto_connect(const PeerId& peer, const std::optional<CapabilitySet>& caps) {
  if (!config_.auto_connect_payment_capable || !running_.load(std::memory_order_acquire)) {
    return;
  }
  if (!caps || !caps->payment_capable) {
    return;
  }
  if (connections_->get_state(peer) != ConnectionState::Disconnected) {
    return;
  }
  // The peer does not expose our service; only an explicit connect() retries it
  if (connections_->last_failure(peer) == ErrorCode::ServiceNotFound) {
    return;
  }
  if (connections_->outbound_count() >= config_.connection.max_outbound) {
    return;
  }
  LOG_ENGINE_DEBUG("auto-connecting to payment-capable peer {}", peer);
  connections_->connect(peer);
}

void Engine::run_maintenance() {
  const auto evicted = registry_.evict_stale(util::GetSteadyTime(), config_.stale_ttl);
  for (const auto& peer : evicted) {
    LOG_ENGINE_DEBUG("peer {} went stale", peer);
    handle_event(PeerWentStale{peer});
  }
  const size_t pruned = connections_->prune_idle();
  if (!evicted.empty() || pruned > 0) {
    LOG_ENGINE_DEBUG("maintenance: evicted {} stale peers, pruned {} idle links", evicted.size(), pruned);
  }
}

void Engine::schedule_next_maintenance() {
  if (!maintenance_timer_ || !running_.load(std::memory_order_acquire)) {
    return;
  }

  std::weak_ptr<bool> alive = lifetime_;
  maintenance_timer_->expires_after(config_.eviction_interval);
  maintenance_timer_->async_wait([this, alive](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || alive.expired()) {
      return;
    }
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    run_maintenance();
    schedule_next_maintenance();
  });
}

void Engine::test_hook_run_maintenance() {
  post([this]() { run_maintenance(); });
}

}  // namespace network
}  // namespace proximity
