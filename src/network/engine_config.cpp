// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/engine_config.hpp"

#include "util/logging.hpp"

#include <fstream>

using json = nlohmann::json;

namespace proximity {
namespace network {

namespace {

std::chrono::milliseconds ReadMs(const json& j, const char* key, std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

util::BackoffPolicy ReadBackoff(const json& j, const char* key, const util::BackoffPolicy& base) {
  if (!j.contains(key)) {
    return base;
  }
  const json& b = j.at(key);
  util::BackoffPolicy policy = base;
  policy.base = ReadMs(b, "base_ms", base.base);
  policy.cap = ReadMs(b, "cap_ms", base.cap);
  policy.jitter = b.value("jitter", base.jitter);
  policy.max_attempts = b.value("max_attempts", base.max_attempts);
  return policy;
}

json BackoffToJson(const util::BackoffPolicy& policy) {
  return {{"base_ms", policy.base.count()},
          {"cap_ms", policy.cap.count()},
          {"jitter", policy.jitter},
          {"max_attempts", policy.max_attempts}};
}

std::optional<std::string> ValidateBackoff(const util::BackoffPolicy& policy, const std::string& name) {
  if (policy.jitter < 0.0 || policy.jitter > 1.0) {
    return name + ".jitter must be within [0, 1]";
  }
  if (policy.base.count() < 0 || policy.cap.count() < 0) {
    return name + " delays must not be negative";
  }
  if (policy.cap < policy.base) {
    return name + ".cap_ms must not be below base_ms";
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> ValidateEngineConfig(const Engine::Config& config) {
  const auto& conn = config.connection;

  if (config.io_threads > 1) {
    return "io_threads must be 0 or 1";
  }
  if (conn.max_frame_size > protocol::MAX_FRAME_SIZE_LIMIT) {
    return "connection.max_frame_size must not exceed 65535";
  }
  if (conn.fallback_mtu == 0) {
    return "connection.fallback_mtu must be positive";
  }
  if (conn.max_inbound == 0) {
    return "connection.max_inbound must be positive";
  }
  if (conn.max_queued_frames == 0) {
    return "connection.max_queued_frames must be positive";
  }
  if (config.event_queue_capacity == 0) {
    return "event_queue_capacity must be positive";
  }
  if (config.eviction_interval.count() <= 0) {
    return "eviction_interval_ms must be positive";
  }
  if (config.stale_ttl.count() < 0) {
    return "stale_ttl_ms must not be negative";
  }
  if (auto error = ValidateBackoff(conn.reconnect, "connection.reconnect")) {
    return error;
  }
  if (auto error = ValidateBackoff(config.discovery.start_retry, "discovery.start_retry")) {
    return error;
  }
  if (auto error = ValidateBackoff(config.advertise.start_retry, "advertise.start_retry")) {
    return error;
  }
  return std::nullopt;
}

std::optional<Engine::Config> ParseEngineConfig(const json& doc, const Engine::Config& base) {
  if (!doc.is_object()) {
    LOG_ERROR("engine config: document is not a JSON object");
    return std::nullopt;
  }

  Engine::Config config = base;
  try {
    config.io_threads = doc.value("io_threads", config.io_threads);
    config.local_peer_id = doc.value("local_peer_id", config.local_peer_id);
    config.local_name = doc.value("local_name", config.local_name);
    config.log_level = doc.value("log_level", config.log_level);
    config.auto_connect_payment_capable = doc.value("auto_connect_payment_capable", config.auto_connect_payment_capable);
    config.stale_ttl = ReadMs(doc, "stale_ttl_ms", config.stale_ttl);
    config.eviction_interval = ReadMs(doc, "eviction_interval_ms", config.eviction_interval);
    config.event_queue_capacity = doc.value("event_queue_capacity", config.event_queue_capacity);

    if (doc.contains("connection")) {
      const json& c = doc.at("connection");
      auto& conn = config.connection;
      conn.max_inbound = c.value("max_inbound", conn.max_inbound);
      conn.max_outbound = c.value("max_outbound", conn.max_outbound);
      conn.max_frame_size = c.value("max_frame_size", conn.max_frame_size);
      conn.max_queued_frames = c.value("max_queued_frames", conn.max_queued_frames);
      conn.fallback_mtu = c.value("fallback_mtu", conn.fallback_mtu);
      conn.connect_timeout = ReadMs(c, "connect_timeout_ms", conn.connect_timeout);
      conn.discovery_timeout = ReadMs(c, "discovery_timeout_ms", conn.discovery_timeout);
      conn.disconnect_timeout = ReadMs(c, "disconnect_timeout_ms", conn.disconnect_timeout);
      conn.reconnect = ReadBackoff(c, "reconnect", conn.reconnect);
      conn.rng_seed = c.value("rng_seed", conn.rng_seed);
    }

    if (doc.contains("discovery")) {
      const json& d = doc.at("discovery");
      config.discovery.service_id = d.value("service_id", config.discovery.service_id);
      config.discovery.start_retry = ReadBackoff(d, "start_retry", config.discovery.start_retry);
      config.discovery.rng_seed = d.value("rng_seed", config.discovery.rng_seed);
    }

    if (doc.contains("advertise")) {
      const json& a = doc.at("advertise");
      config.advertise.restart_debounce = ReadMs(a, "restart_debounce_ms", config.advertise.restart_debounce);
      config.advertise.start_retry = ReadBackoff(a, "start_retry", config.advertise.start_retry);
      config.advertise.rng_seed = a.value("rng_seed", config.advertise.rng_seed);
    }
  } catch (const json::exception& e) {
    LOG_ERROR("engine config: {}", e.what());
    return std::nullopt;
  }

  if (auto error = ValidateEngineConfig(config)) {
    LOG_ERROR("engine config: {}", *error);
    return std::nullopt;
  }
  return config;
}

std::optional<Engine::Config> ParseEngineConfig(const std::string& text, const Engine::Config& base) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    LOG_ERROR("engine config: malformed JSON");
    return std::nullopt;
  }
  return ParseEngineConfig(doc, base);
}

std::optional<Engine::Config> LoadEngineConfig(const std::string& path, const Engine::Config& base) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("engine config: cannot open {}", path);
    return std::nullopt;
  }

  try {
    json doc;
    file >> doc;
    return ParseEngineConfig(doc, base);
  } catch (const std::exception& e) {
    LOG_ERROR("engine config: failed to parse {}: {}", path, e.what());
    return std::nullopt;
  }
}

json EngineConfigToJson(const Engine::Config& config) {
  const auto& conn = config.connection;
  json doc;
  doc["io_threads"] = config.io_threads;
  doc["local_peer_id"] = config.local_peer_id;
  doc["local_name"] = config.local_name;
  doc["log_level"] = config.log_level;
  doc["auto_connect_payment_capable"] = config.auto_connect_payment_capable;
  doc["stale_ttl_ms"] = config.stale_ttl.count();
  doc["eviction_interval_ms"] = config.eviction_interval.count();
  doc["event_queue_capacity"] = config.event_queue_capacity;
  doc["connection"] = {{"max_inbound", conn.max_inbound},
                       {"max_outbound", conn.max_outbound},
                       {"max_frame_size", conn.max_frame_size},
                       {"max_queued_frames", conn.max_queued_frames},
                       {"fallback_mtu", conn.fallback_mtu},
                       {"connect_timeout_ms", conn.connect_timeout.count()},
                       {"discovery_timeout_ms", conn.discovery_timeout.count()},
                       {"disconnect_timeout_ms", conn.disconnect_timeout.count()},
                       {"reconnect", BackoffToJson(conn.reconnect)},
                       {"rng_seed", conn.rng_seed}};
  doc["discovery"] = {{"service_id", config.discovery.service_id},
                      {"start_retry", BackoffToJson(config.discovery.start_retry)},
                      {"rng_seed", config.discovery.rng_seed}};
  doc["advertise"] = {{"restart_debounce_ms", config.advertise.restart_debounce.count()},
                      {"start_retry", BackoffToJson(config.advertise.start_retry)},
                      {"rng_seed", config.advertise.rng_seed}};
  return doc;
}

}  // namespace network
}  // namespace proximity
