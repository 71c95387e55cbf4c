/**
 * @file node_config.hpp
 * @brief Node limits, defaults and runtime configuration
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>

#include "meshdir/utilities.hpp"

namespace meshdir {
namespace config {

// ============================================================================
// Fragmentation
// ============================================================================

/// Payload bytes carried by one fragment
constexpr size_t DEFAULT_FRAGMENT_SIZE = 128;

/// Upper bound accepted for a configured fragment size
constexpr size_t MAX_FRAGMENT_SIZE = 64 * 1024;

/// Hard ceiling on the fragment count of one message, whatever the fragment size
constexpr uint32_t MAX_FRAGMENTS_PER_MESSAGE = 1u << 16;

// ============================================================================
// Reassembly
// ============================================================================

/// Incomplete sessions tracked before the oldest is evicted
constexpr size_t DEFAULT_MAX_PENDING_SESSIONS = 256;

/// Completed session keys remembered to discard late duplicates
constexpr size_t DEFAULT_COMPLETED_HISTORY = 1024;

/// Payload bytes buffered across all incomplete sessions
constexpr size_t DEFAULT_MAX_BUFFERED_BYTES = 16 * 1024 * 1024;

/// Idle time after which an incomplete session is dropped
constexpr auto DEFAULT_SESSION_IDLE_TIMEOUT = std::chrono::milliseconds(30000);

/// Interval of the periodic eviction sweep
constexpr auto DEFAULT_SWEEP_INTERVAL = std::chrono::milliseconds(5000);

// ============================================================================
// Channels and payloads
// ============================================================================

/// Capacity of every bounded channel created by a node
constexpr size_t DEFAULT_CHANNEL_CAPACITY = 4096;

/// Maximum JSON request size accepted from the network (1MB)
constexpr size_t MAX_JSON_SIZE = 1024 * 1024;

/**
 * @brief Fragments needed to carry a MAX_JSON_SIZE message
 * @param fragment_size Payload bytes per fragment (must be positive)
 * @return Fragment count, capped at MAX_FRAGMENTS_PER_MESSAGE
 */
constexpr uint32_t max_fragments_for(size_t fragment_size) {
    size_t count = (MAX_JSON_SIZE + fragment_size - 1) / fragment_size;
    return count > MAX_FRAGMENTS_PER_MESSAGE ? MAX_FRAGMENTS_PER_MESSAGE : static_cast<uint32_t>(count);
}

/// Maximum title length accepted for a content record
constexpr size_t MAX_TITLE_LENGTH = 255;

// ============================================================================
// Environment variables
// ============================================================================

constexpr const char* ENV_FRAGMENT_SIZE = "MESHDIR_FRAGMENT_SIZE";
constexpr const char* ENV_MAX_PENDING_SESSIONS = "MESHDIR_MAX_PENDING_SESSIONS";
constexpr const char* ENV_SESSION_TIMEOUT_MS = "MESHDIR_SESSION_TIMEOUT_MS";
constexpr const char* ENV_SWEEP_INTERVAL_MS = "MESHDIR_SWEEP_INTERVAL_MS";
constexpr const char* ENV_CHANNEL_CAPACITY = "MESHDIR_CHANNEL_CAPACITY";
constexpr const char* ENV_LOG_LEVEL = "MESHDIR_LOG_LEVEL";

} // namespace config

/**
 * @brief Runtime configuration shared by the routing layer, the assembler
 *        and the node processing loop
 */
struct NodeConfig {
    size_t max_fragment_size = config::DEFAULT_FRAGMENT_SIZE;          ///< Payload bytes per fragment
    size_t max_pending_sessions = config::DEFAULT_MAX_PENDING_SESSIONS; ///< Incomplete session limit
    size_t completed_history = config::DEFAULT_COMPLETED_HISTORY;       ///< Remembered completed keys
    std::chrono::milliseconds session_idle_timeout = config::DEFAULT_SESSION_IDLE_TIMEOUT;
    std::chrono::milliseconds sweep_interval = config::DEFAULT_SWEEP_INTERVAL;
    size_t channel_capacity = config::DEFAULT_CHANNEL_CAPACITY;         ///< Bounded channel size
    utilities::LogLevel log_level = utilities::LogLevel::INFO;

    /**
     * @brief Check every field is within its accepted range
     * @param error Receives a description of the first invalid field
     * @return true if valid, false otherwise
     */
    bool validate(std::string* error = nullptr) const;

    /**
     * @brief Build a configuration from MESHDIR_* environment variables
     *
     * Unset variables keep their defaults; unparsable or out-of-range values
     * are logged and ignored.
     */
    static NodeConfig from_environment();
};

} // namespace meshdir
