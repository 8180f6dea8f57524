// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/engine.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace proximity {
namespace network {

/**
 * Engine configuration documents
 *
 * Every field of Engine::Config (including the nested component configs) may
 * be overridden from JSON; absent keys keep their defaults. Durations are in
 * milliseconds and carry an "_ms" suffix.
 *
 * {
 *   "log_level": "info",
 *   "local_peer_id": "AA:BB:CC:DD:EE:01",
 *   "local_name": "alice",
 *   "auto_connect_payment_capable": true,
 *   "stale_ttl_ms": 60000,
 *   "connection": { "max_inbound": 4, "reconnect": { "base_ms": 500, "jitter": 0.2 } },
 *   "discovery": { "start_retry": { "max_attempts": 5 } },
 *   "advertise": { "restart_debounce_ms": 250 }
 * }
 */

// Returns a description of the first invalid field, or nullopt if valid
std::optional<std::string> ValidateEngineConfig(const Engine::Config& config);

// Parse and validate. Malformed documents (wrong types, invalid values) are
// logged and yield nullopt.
std::optional<Engine::Config> ParseEngineConfig(const nlohmann::json& doc, const Engine::Config& base = Engine::Config{});
std::optional<Engine::Config> ParseEngineConfig(const std::string& text, const Engine::Config& base = Engine::Config{});

// Read a JSON file. A missing or unreadable file yields nullopt.
std::optional<Engine::Config> LoadEngineConfig(const std::string& path, const Engine::Config& base = Engine::Config{});

nlohmann::json EngineConfigToJson(const Engine::Config& config);

}  // namespace network
}  // namespace proximity
