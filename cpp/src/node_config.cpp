/**
 * @file node_config.cpp
 * @brief Validation and environment loading of node configuration
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/node_config.hpp"

#include <optional>
#include <string>

namespace meshdir {

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

// Reads an unsigned variable; returns std::nullopt when unset or invalid
std::optional<uint64_t> read_unsigned_env(const char* name) {
    std::string raw = utilities::get_env(name);
    if (raw.empty()) {
        return std::nullopt;
    }

    auto value = utilities::parse_unsigned(raw);
    if (!value) {
        utilities::log_warn(std::string("NodeConfig: Ignoring non-numeric ") + name + "='" + raw + "'");
    }
    return value;
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

bool NodeConfig::validate(std::string* error) const {
    if (max_fragment_size == 0 || max_fragment_size > config::MAX_FRAGMENT_SIZE) {
        set_error(error, "max_fragment_size must be in [1, " +
                  std::to_string(config::MAX_FRAGMENT_SIZE) + "]");
        return false;
    }

    if (max_pending_sessions == 0) {
        set_error(error, "max_pending_sessions must be positive");
        return false;
    }

    if (session_idle_timeout.count() <= 0) {
        set_error(error, "session_idle_timeout must be positive");
        return false;
    }

    if (sweep_interval.count() <= 0) {
        set_error(error, "sweep_interval must be positive");
        return false;
    }

    if (channel_capacity == 0) {
        set_error(error, "channel_capacity must be positive");
        return false;
    }

    return true;
}

// ============================================================================
// Environment loading
// ============================================================================

NodeConfig NodeConfig::from_environment() {
    NodeConfig cfg;
    NodeConfig defaults;

    if (auto v = read_unsigned_env(config::ENV_FRAGMENT_SIZE)) {
        cfg.max_fragment_size = static_cast<size_t>(*v);
    }
    if (auto v = read_unsigned_env(config::ENV_MAX_PENDING_SESSIONS)) {
        cfg.max_pending_sessions = static_cast<size_t>(*v);
    }
    if (auto v = read_unsigned_env(config::ENV_SESSION_TIMEOUT_MS)) {
        cfg.session_idle_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = read_unsigned_env(config::ENV_SWEEP_INTERVAL_MS)) {
        cfg.sweep_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = read_unsigned_env(config::ENV_CHANNEL_CAPACITY)) {
        cfg.channel_capacity = static_cast<size_t>(*v);
    }

    std::string level = utilities::get_env(config::ENV_LOG_LEVEL);
    if (!level.empty()) {
        auto parsed = utilities::parse_log_level(level);
        if (parsed) {
            cfg.log_level = *parsed;
        } else {
            utilities::log_warn("NodeConfig: Unknown log level '" + level + "', keeping default");
        }
    }

    std::string error;
    if (!cfg.validate(&error)) {
        utilities::log_warn("NodeConfig: Invalid environment configuration (" + error +
                            "), using defaults");
        defaults.log_level = cfg.log_level;
        return defaults;
    }

    return cfg;
}

} // namespace meshdir
