// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_manager.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <asio/post.hpp>

namespace proximity {
namespace network {

ConnectionManager::ConnectionManager(asio::io_context& io_context, LinkTransportPtr transport, PeerRegistry& registry,
                                     EventSink sink, const Config& config)
    : io_context_(io_context),
      transport_(std::move(transport)),
      registry_(registry),
      sink_(std::move(sink)),
      config_(config),
      backoff_seed_(config.rng_seed),
      lifetime_(std::make_shared<bool>(true)) {
  if (!transport_) {
    throw std::invalid_argument("ConnectionManager requires a LinkTransport");
  }
  if (config_.max_frame_size > protocol::MAX_FRAME_SIZE_LIMIT) {
    throw std::invalid_argument("max_frame_size exceeds the 16-bit frame header");
  }
}

ConnectionManager::~ConnectionManager() {
  for (auto& [id, pl] : peers_) {
    if (pl.timer) {
      pl.timer->cancel();
    }
  }
}

void ConnectionManager::Start() {
  shutting_down_ = false;

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;

  LinkTransport::Callbacks callbacks;
  callbacks.on_inbound = [this, io, alive](LinkId link, const PeerId& peer) {
    asio::post(*io, [this, alive, link, peer]() {
      if (alive.expired()) {
        return;
      }
      try {
        HandleInboundLink(link, peer);
      } catch (const std::exception& e) {
        LOG_LINK_ERROR("exception handling inbound link {} from {}: {}", link, peer, e.what());
      }
    });
  };
  callbacks.on_data = [this, io, alive](LinkId link, uint16_t characteristic, const std::vector<uint8_t>& chunk) {
    asio::post(*io, [this, alive, link, characteristic, chunk]() {
      if (alive.expired()) {
        return;
      }
      try {
        HandleData(link, characteristic, chunk);
      } catch (const std::exception& e) {
        LOG_LINK_ERROR("exception handling data on link {}: {}", link, e.what());
      }
    });
  };
  callbacks.on_link_lost = [this, io, alive](LinkId link, ErrorCode reason) {
    asio::post(*io, [this, alive, link, reason]() {
      if (alive.expired()) {
        return;
      }
      try {
        HandleLinkLost(link, reason);
      } catch (const std::exception& e) {
        LOG_LINK_ERROR("exception handling loss of link {}: {}", link, e.what());
      }
    });
  };
  transport_->set_callbacks(std::move(callbacks));
}

void ConnectionManager::Shutdown() {
  shutting_down_ = true;

  std::vector<PeerId> ids;
  ids.reserve(peers_.size());
  for (const auto& [id, pl] : peers_) {
    ids.push_back(id);
  }

  for (const auto& id : ids) {
    disconnect(id);
    // No confirmation wait during shutdown
    if (auto* pl = find(id); pl && pl->state == ConnectionState::Disconnecting) {
      finalize_disconnect(*pl);
    }
  }
  LOG_LINK_DEBUG("connection manager shut down ({} peers)", ids.size());
}

// ============================================================================
// Lookup
// ============================================================================

ConnectionManager::PeerLink& ConnectionManager::get_or_create(const PeerId& peer) {
  auto [it, inserted] = peers_.try_emplace(peer);
  if (inserted) {
    it->second.peer = peer;
    it->second.timer = std::make_unique<asio::steady_timer>(io_context_);
    const uint64_t seed = backoff_seed_ == 0 ? 0 : backoff_seed_ + peers_.size();
    it->second.reconnect_backoff = std::make_unique<util::ExponentialBackoff>(config_.reconnect, seed);
  }
  return it->second;
}

ConnectionManager::PeerLink* ConnectionManager::find(const PeerId& peer) {
  auto it = peers_.find(peer);
  return it == peers_.end() ? nullptr : &it->second;
}

const ConnectionManager::PeerLink* ConnectionManager::find(const PeerId& peer) const {
  auto it = peers_.find(peer);
  return it == peers_.end() ? nullptr : &it->second;
}

ConnectionManager::PeerLink* ConnectionManager::find_by_link(LinkId link) {
  auto it = links_.find(link);
  if (it == links_.end()) {
    return nullptr;
  }
  PeerLink* pl = find(it->second);
  if (!pl || pl->link != link) {
    return nullptr;
  }
  return pl;
}

// ============================================================================
// Client path
// ============================================================================

void ConnectionManager::connect(const PeerId& peer) {
  if (peer.empty() || shutting_down_) {
    return;
  }

  PeerLink& pl = get_or_create(peer);

  if (IsActiveState(pl.state)) {
    LOG_LINK_TRACE("connect to {} reuses existing {} link", peer, ConnectionStateAsString(pl.state));
    if (pl.role == ConnectionRole::Client) {
      pl.wanted = true;
    }
    return;
  }

  if (pl.state == ConnectionState::Disconnecting) {
    finalize_disconnect(pl);
  } else if (pl.state == ConnectionState::Failed) {
    // Explicit connect overrides the pending reconnect delay
    cancel_timer(pl);
    set_state(pl, ConnectionState::Disconnected);
  }

  if (outbound_count() >= config_.max_outbound) {
    LOG_LINK_WARN("outbound link limit ({}) reached, not connecting to {}", config_.max_outbound, peer);
    pl.role = ConnectionRole::Client;
    pl.wanted = false;
    set_state(pl, ConnectionState::Failed, ErrorCode::ResourceExhausted);
    set_state(pl, ConnectionState::Disconnected, ErrorCode::ResourceExhausted);
    return;
  }

  pl.wanted = true;
  pl.reconnect_backoff->reset();
  begin_connect(pl);
}

void ConnectionManager::begin_connect(PeerLink& pl) {
  pl.role = ConnectionRole::Client;
  pl.epoch = next_epoch_++;
  pl.remote_payment = false;
  set_state(pl, ConnectionState::Connecting);

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;
  const PeerId peer = pl.peer;
  const uint64_t epoch = pl.epoch;

  LinkId link = transport_->connect(peer, [this, io, alive, peer, epoch](ErrorCode result) {
    asio::post(*io, [this, alive, peer, epoch, result]() {
      if (alive.expired()) {
        return;
      }
      HandleConnectResult(peer, epoch, result);
    });
  });

  if (link == INVALID_LINK_ID) {
    LOG_LINK_WARN("transport could not start a link to {}", peer);
    fail(pl, ErrorCode::ResourceExhausted);
    return;
  }

  pl.link = link;
  links_[link] = peer;
  arm_timer(pl, config_.connect_timeout, &ConnectionManager::on_connect_timeout);
  LOG_LINK_DEBUG("connecting to {} (link {})", peer, link);
}

void ConnectionManager::HandleConnectResult(const PeerId& peer, uint64_t epoch, ErrorCode result) {
  PeerLink* pl = find(peer);
  if (!pl || pl->epoch != epoch || pl->state != ConnectionState::Connecting) {
    return;
  }

  if (result != ErrorCode::Success) {
    LOG_LINK_DEBUG("link to {} failed: {}", peer, ErrorCodeAsString(result));
    fail(*pl, result);
    return;
  }

  pl->mtu = link_mtu(pl->link);
  set_state(*pl, ConnectionState::Discovering);
  arm_timer(*pl, config_.discovery_timeout, &ConnectionManager::on_discovery_timeout);

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;
  transport_->discover_services(
      pl->link, [this, io, alive, peer, epoch](ErrorCode discovered, const std::vector<ServiceLayout>& services) {
        asio::post(*io, [this, alive, peer, epoch, discovered, services]() {
          if (alive.expired()) {
            return;
          }
          HandleServicesDiscovered(peer, epoch, discovered, services);
        });
      });
}

void ConnectionManager::HandleServicesDiscovered(const PeerId& peer, uint64_t epoch, ErrorCode result,
                                                 const std::vector<ServiceLayout>& services) {
  PeerLink* pl = find(peer);
  if (!pl || pl->epoch != epoch || pl->state != ConnectionState::Discovering) {
    return;
  }

  if (result != ErrorCode::Success) {
    fail(*pl, result);
    return;
  }

  auto exposes = [&services](uint16_t service, uint16_t characteristic) {
    return std::any_of(services.begin(), services.end(), [&](const ServiceLayout& layout) {
      return layout.service == service &&
             std::find(layout.characteristics.begin(), layout.characteristics.end(), characteristic) !=
                 layout.characteristics.end();
    });
  };

  if (!exposes(protocol::services::CHAT, protocol::characteristics::MESSAGE)) {
    LOG_LINK_WARN("{} does not expose the message characteristic", peer);
    fail(*pl, ErrorCode::ServiceNotFound);
    return;
  }

  pl->remote_payment = exposes(protocol::services::PAYMENT, protocol::characteristics::PAYMENT);
  become_ready(*pl);
}

// ============================================================================
// Server path
// ============================================================================

void ConnectionManager::HandleInboundLink(LinkId link, const PeerId& peer) {
  if (link == INVALID_LINK_ID) {
    return;
  }
  if (peer.empty() || shutting_down_) {
    transport_->disconnect(link);
    return;
  }

  if (inbound_count() >= config_.max_inbound) {
    LOG_LINK_WARN_RL("inbound link limit ({}) reached, rejecting {}", config_.max_inbound, peer);
    transport_->disconnect(link);
    return;
  }

  PeerLink& pl = get_or_create(peer);

  switch (pl.state) {
  case ConnectionState::Ready:
    LOG_LINK_DEBUG("rejecting inbound link {} from {}: already connected", link, peer);
    transport_->disconnect(link);
    return;

  case ConnectionState::Connecting:
  case ConnectionState::Discovering:
    if (!config_.local_peer_id.empty() && config_.local_peer_id < peer) {
      LOG_LINK_DEBUG("simultaneous connect with {}: keeping outbound attempt", peer);
      transport_->disconnect(link);
      return;
    }
    LOG_LINK_DEBUG("simultaneous connect with {}: accepting inbound link {}", peer, link);
    cancel_timer(pl);
    detach_link(pl, true);
    release_buffers(pl, ErrorCode::Cancelled);
    break;

  case ConnectionState::Disconnecting:
    finalize_disconnect(pl);
    break;

  case ConnectionState::Failed:
    cancel_timer(pl);
    break;

  case ConnectionState::Disconnected:
  default:
    break;
  }

  accept_inbound(pl, link);
}

void ConnectionManager::accept_inbound(PeerLink& pl, LinkId link) {
  pl.role = ConnectionRole::Server;
  pl.link = link;
  pl.epoch = next_epoch_++;
  pl.mtu = link_mtu(link);
  links_[link] = pl.peer;

  // The remote's payment characteristic is known only from its advertisement
  auto record = registry_.get(pl.peer);
  pl.remote_payment = record && record->capabilities && record->capabilities->payment_capable;

  LOG_LINK_INFO("accepted inbound link {} from {}", link, pl.peer);
  become_ready(pl);
}

void ConnectionManager::become_ready(PeerLink& pl) {
  cancel_timer(pl);
  pl.handle_id = next_handle_id_++;
  pl.outbound = std::make_unique<std::deque<OutboundFrame>>();
  pl.write_in_flight = false;
  pl.write_len = 0;
  pl.reconnect_backoff->reset();
  set_state(pl, ConnectionState::Ready);
  LOG_LINK_INFO("{} ready as {} (link {}, mtu {})", pl.peer, ConnectionRoleAsString(pl.role), pl.link, pl.mtu);
}

// ============================================================================
// Failure, loss and teardown
// ============================================================================

void ConnectionManager::detach_link(PeerLink& pl, bool disconnect_transport) {
  if (pl.link == INVALID_LINK_ID) {
    return;
  }
  links_.erase(pl.link);
  if (disconnect_transport) {
    transport_->disconnect(pl.link);
  }
  pl.link = INVALID_LINK_ID;
  pl.epoch = next_epoch_++;
}

void ConnectionManager::release_buffers(PeerLink& pl, ErrorCode send_failure) {
  if (pl.outbound) {
    // Move out first; sink callbacks must not observe a half-released queue
    auto pending = std::move(pl.outbound);
    for (const auto& frame : *pending) {
      sink_(SendFailed{pl.peer, frame.send_id, send_failure});
    }
  }
  pl.reassemblers.clear();
  pl.write_in_flight = false;
  pl.write_len = 0;
}

void ConnectionManager::fail(PeerLink& pl, ErrorCode reason) {
  cancel_timer(pl);
  detach_link(pl, true);
  release_buffers(pl, reason == ErrorCode::LinkTimeout ? ErrorCode::LinkLost : reason);
  set_state(pl, ConnectionState::Failed, reason);

  std::optional<std::chrono::milliseconds> delay;
  if (pl.wanted && pl.role == ConnectionRole::Client && IsTransientError(reason) && !shutting_down_) {
    delay = pl.reconnect_backoff->next();
  }

  if (delay) {
    LOG_LINK_DEBUG("reconnecting to {} in {}ms (attempt {}/{})", pl.peer, delay->count(),
                   pl.reconnect_backoff->attempts(), config_.reconnect.max_attempts);
    arm_timer(pl, *delay, &ConnectionManager::on_reconnect_due);
    return;
  }

  if (pl.wanted && IsTransientError(reason)) {
    LOG_LINK_INFO("giving up on {} after {} reconnect attempts", pl.peer, pl.reconnect_backoff->attempts());
  }
  pl.wanted = false;
  set_state(pl, ConnectionState::Disconnected, reason);
}

void ConnectionManager::lose_server_link(PeerLink& pl, ErrorCode reason) {
  cancel_timer(pl);
  detach_link(pl, false);
  release_buffers(pl, reason);
  set_state(pl, ConnectionState::Disconnected, reason);
}

void ConnectionManager::disconnect(const PeerId& peer) {
  PeerLink* pl = find(peer);
  if (!pl) {
    return;
  }

  pl->wanted = false;

  switch (pl->state) {
  case ConnectionState::Disconnected:
  case ConnectionState::Disconnecting:
    return;
  case ConnectionState::Failed:
    // Cancel the pending reconnect
    cancel_timer(*pl);
    set_state(*pl, ConnectionState::Disconnected);
    return;
  default:
    break;
  }

  cancel_timer(*pl);
  release_buffers(*pl, ErrorCode::Cancelled);

  if (pl->link == INVALID_LINK_ID) {
    set_state(*pl, ConnectionState::Disconnected);
    return;
  }

  set_state(*pl, ConnectionState::Disconnecting);
  transport_->disconnect(pl->link);
  arm_timer(*pl, config_.disconnect_timeout, &ConnectionManager::on_disconnect_timeout);
  LOG_LINK_DEBUG("disconnecting from {} (link {})", peer, pl->link);
}

void ConnectionManager::finalize_disconnect(PeerLink& pl) {
  cancel_timer(pl);
  detach_link(pl, false);
  release_buffers(pl, ErrorCode::Cancelled);
  set_state(pl, ConnectionState::Disconnected);
}

void ConnectionManager::HandleLinkLost(LinkId link, ErrorCode reason) {
  PeerLink* pl = find_by_link(link);
  if (!pl) {
    links_.erase(link);
    LOG_LINK_TRACE("ignoring loss of untracked link {}", link);
    return;
  }

  const ErrorCode effective = reason == ErrorCode::Success ? ErrorCode::LinkLost : reason;

  switch (pl->state) {
  case ConnectionState::Disconnecting:
    finalize_disconnect(*pl);
    break;
  case ConnectionState::Connecting:
  case ConnectionState::Discovering:
    fail(*pl, effective);
    break;
  case ConnectionState::Ready:
    LOG_LINK_INFO("link to {} lost: {}", pl->peer, ErrorCodeAsString(effective));
    if (pl->role == ConnectionRole::Client) {
      // Already gone on the transport side
      links_.erase(pl->link);
      pl->link = INVALID_LINK_ID;
      fail(*pl, effective);
    } else {
      lose_server_link(*pl, effective);
    }
    break;
  default:
    links_.erase(link);
    break;
  }
}

// ============================================================================
// Data path
// ============================================================================

size_t ConnectionManager::link_mtu(LinkId link) const {
  const size_t reported = transport_->mtu(link);
  return std::max<size_t>(reported == 0 ? config_.fallback_mtu : reported, 1);
}

std::optional<Channel> ConnectionManager::ChannelForCharacteristic(uint16_t characteristic) {
  if (characteristic == protocol::characteristics::MESSAGE) {
    return Channel::Message;
  }
  if (characteristic == protocol::characteristics::PAYMENT) {
    return Channel::Payment;
  }
  return std::nullopt;
}

void ConnectionManager::send(const PeerId& peer, SendId send_id, std::vector<uint8_t> payload, Channel channel) {
  if (payload.size() > config_.max_frame_size) {
    LOG_LINK_DEBUG("send {} to {} rejected: {} bytes exceeds max frame size {}", send_id, peer, payload.size(),
                   config_.max_frame_size);
    sink_(SendFailed{peer, send_id, ErrorCode::FrameTooLarge});
    return;
  }

  PeerLink* pl = find(peer);
  if (!pl || pl->state != ConnectionState::Ready || !pl->outbound) {
    sink_(SendFailed{peer, send_id, ErrorCode::NotConnected});
    return;
  }

  if (channel == Channel::Payment && !pl->remote_payment) {
    sink_(SendFailed{peer, send_id, ErrorCode::ServiceNotFound});
    return;
  }

  if (pl->outbound->size() >= config_.max_queued_frames) {
    LOG_LINK_DEBUG("outbound queue to {} full ({} frames)", peer, pl->outbound->size());
    sink_(SendFailed{peer, send_id, ErrorCode::ResourceExhausted});
    return;
  }

  OutboundFrame frame;
  frame.send_id = send_id;
  frame.channel = channel;
  frame.bytes = FrameCodec::encode(payload);
  pl->outbound->push_back(std::move(frame));
  pump(*pl);
}

void ConnectionManager::pump(PeerLink& pl) {
  if (pl.write_in_flight || pl.state != ConnectionState::Ready || !pl.outbound || pl.outbound->empty()) {
    return;
  }

  const OutboundFrame& frame = pl.outbound->front();
  const size_t n = FrameCodec::chunk_size(frame.bytes.size(), frame.offset, pl.mtu);
  std::vector<uint8_t> chunk(frame.bytes.begin() + static_cast<std::ptrdiff_t>(frame.offset),
                             frame.bytes.begin() + static_cast<std::ptrdiff_t>(frame.offset + n));

  pl.write_in_flight = true;
  pl.write_len = n;

  std::weak_ptr<bool> alive = lifetime_;
  asio::io_context* io = &io_context_;
  const PeerId peer = pl.peer;
  const uint64_t epoch = pl.epoch;
  transport_->write(pl.link, ChannelCharacteristic(frame.channel), chunk,
                    [this, io, alive, peer, epoch](ErrorCode result) {
                      asio::post(*io, [this, alive, peer, epoch, result]() {
                        if (alive.expired()) {
                          return;
                        }
                        HandleWriteComplete(peer, epoch, result);
                      });
                    });
}

void ConnectionManager::HandleWriteComplete(const PeerId& peer, uint64_t epoch, ErrorCode result) {
  PeerLink* pl = find(peer);
  if (!pl || pl->epoch != epoch || pl->state != ConnectionState::Ready || !pl->write_in_flight ||
      !pl->outbound || pl->outbound->empty()) {
    return;
  }

  pl->write_in_flight = false;

  if (result != ErrorCode::Success) {
    LOG_LINK_WARN("write to {} failed: {}, dropping link", peer, ErrorCodeAsString(result));
    const LinkId link = pl->link;
    if (pl->role == ConnectionRole::Client) {
      fail(*pl, ErrorCode::LinkLost);
    } else {
      transport_->disconnect(link);
      lose_server_link(*pl, ErrorCode::LinkLost);
    }
    return;
  }

  OutboundFrame& frame = pl->outbound->front();
  frame.offset += pl->write_len;
  pl->write_len = 0;

  if (frame.offset >= frame.bytes.size()) {
    FrameSent sent{peer, frame.send_id, frame.channel};
    pl->outbound->pop_front();
    LOG_LINK_TRACE("frame {} to {} sent", sent.send_id, peer);
    sink_(std::move(sent));
  }

  pump(*pl);
}

void ConnectionManager::HandleData(LinkId link, uint16_t characteristic, const std::vector<uint8_t>& chunk) {
  PeerLink* pl = find_by_link(link);
  if (!pl) {
    LOG_LINK_TRACE("ignoring {} bytes on untracked link {}", chunk.size(), link);
    return;
  }
  if (pl->state != ConnectionState::Discovering && pl->state != ConnectionState::Ready) {
    return;
  }

  auto channel = ChannelForCharacteristic(characteristic);
  if (!channel) {
    LOG_LINK_WARN_RL("{} wrote to unknown characteristic 0x{:04x}", pl->peer, characteristic);
    return;
  }

  auto& reassembler = pl->reassemblers[*channel];
  if (!reassembler) {
    reassembler = std::make_unique<FrameReassembler>(config_.max_frame_size);
  }

  auto result = reassembler->feed(chunk);
  const PeerId peer = pl->peer;

  for (size_t i = 0; i < result.rejected; ++i) {
    LOG_LINK_WARN_RL("{} sent a frame above {} bytes on {} channel, dropped", peer, config_.max_frame_size,
                     ChannelAsString(*channel));
    sink_(FrameRejected{peer, *channel, ErrorCode::FrameTooLarge});
  }
  for (auto& frame : result.frames) {
    sink_(FrameReceived{peer, *channel, std::move(frame)});
  }
}

// ============================================================================
// State and timers
// ============================================================================

void ConnectionManager::set_state(PeerLink& pl, ConnectionState state, std::optional<ErrorCode> reason) {
  pl.state = state;
  if (state == ConnectionState::Failed) {
    pl.last_failure = reason;
  }

  std::optional<ConnectionHandle> handle;
  if (state == ConnectionState::Ready) {
    handle = ConnectionHandle{pl.handle_id, pl.role, pl.link};
    pl.last_failure.reset();
  }
  registry_.set_connection_state(pl.peer, state, handle);

  LOG_LINK_TRACE("{} -> {}{}", pl.peer, ConnectionStateAsString(state),
                 reason ? " (" + ErrorCodeAsString(*reason) + ")" : std::string());
  sink_(ConnectionStateChanged{pl.peer, state, pl.role, reason});
}

void ConnectionManager::arm_timer(PeerLink& pl, std::chrono::milliseconds delay,
                                  void (ConnectionManager::*on_expiry)(PeerLink&)) {
  const uint64_t seq = ++pl.timer_seq;
  std::weak_ptr<bool> alive = lifetime_;
  const PeerId peer = pl.peer;

  pl.timer->expires_after(delay);
  pl.timer->async_wait([this, alive, peer, seq, on_expiry](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || alive.expired()) {
      return;
    }
    PeerLink* target = find(peer);
    if (!target || target->timer_seq != seq) {
      return;
    }
    (this->*on_expiry)(*target);
  });
}

void ConnectionManager::cancel_timer(PeerLink& pl) {
  ++pl.timer_seq;
  pl.timer->cancel();
}

void ConnectionManager::on_connect_timeout(PeerLink& pl) {
  if (pl.state != ConnectionState::Connecting) {
    return;
  }
  LOG_LINK_DEBUG("connect to {} timed out", pl.peer);
  fail(pl, ErrorCode::LinkTimeout);
}

void ConnectionManager::on_discovery_timeout(PeerLink& pl) {
  if (pl.state != ConnectionState::Discovering) {
    return;
  }
  LOG_LINK_DEBUG("service discovery on {} timed out", pl.peer);
  fail(pl, ErrorCode::LinkTimeout);
}

void ConnectionManager::on_disconnect_timeout(PeerLink& pl) {
  if (pl.state != ConnectionState::Disconnecting) {
    return;
  }
  LOG_LINK_DEBUG("forcing cleanup of {} after disconnect timeout", pl.peer);
  finalize_disconnect(pl);
}

void ConnectionManager::on_reconnect_due(PeerLink& pl) {
  if (pl.state != ConnectionState::Failed) {
    return;
  }
  set_state(pl, ConnectionState::Disconnected);
  if (!pl.wanted || shutting_down_) {
    return;
  }
  if (outbound_count() >= config_.max_outbound) {
    LOG_LINK_DEBUG("reconnect to {} skipped, outbound limit reached", pl.peer);
    pl.wanted = false;
    return;
  }
  begin_connect(pl);
}

// ============================================================================
// Queries
// ============================================================================

ConnectionState ConnectionManager::get_state(const PeerId& peer) const {
  const PeerLink* pl = find(peer);
  return pl ? pl->state : ConnectionState::Disconnected;
}

std::optional<ErrorCode> ConnectionManager::last_failure(const PeerId& peer) const {
  const PeerLink* pl = find(peer);
  if (!pl) {
    return std::nullopt;
  }
  return pl->last_failure;
}

std::optional<ConnectionHandle> ConnectionManager::get_handle(const PeerId& peer) const {
  const PeerLink* pl = find(peer);
  if (!pl || pl->state != ConnectionState::Ready) {
    return std::nullopt;
  }
  return ConnectionHandle{pl->handle_id, pl->role, pl->link};
}

std::vector<PeerId> ConnectionManager::connected_peers() const {
  std::vector<PeerId> out;
  for (const auto& [id, pl] : peers_) {
    if (pl.state == ConnectionState::Ready) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool ConnectionManager::remote_exposes_payment(const PeerId& peer) const {
  const PeerLink* pl = find(peer);
  return pl && pl->state == ConnectionState::Ready && pl->remote_payment;
}

size_t ConnectionManager::inbound_count() const {
  return static_cast<size_t>(std::count_if(peers_.begin(), peers_.end(), [](const auto& entry) {
    return entry.second.role == ConnectionRole::Server && entry.second.state == ConnectionState::Ready;
  }));
}

size_t ConnectionManager::outbound_count() const {
  return static_cast<size_t>(std::count_if(peers_.begin(), peers_.end(), [](const auto& entry) {
    return entry.second.role == ConnectionRole::Client && IsActiveState(entry.second.state);
  }));
}

size_t ConnectionManager::live_reassembly_buffers() const {
  size_t total = 0;
  for (const auto& [id, pl] : peers_) {
    total += pl.reassemblers.size();
  }
  return total;
}

size_t ConnectionManager::live_outbound_queues() const {
  return static_cast<size_t>(
      std::count_if(peers_.begin(), peers_.end(), [](const auto& entry) { return entry.second.outbound != nullptr; }));
}

size_t ConnectionManager::prune_idle() {
  size_t removed = 0;
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (it->second.state == ConnectionState::Disconnected && it->second.link == INVALID_LINK_ID) {
      it->second.timer->cancel();
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace network
}  // namespace proximity
