/**
 * @file fragment_assembler.hpp
 * @brief Per-session reassembly of fragmented overlay messages
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Sessions keyed by (origin, session id)
 * - Out-of-order and duplicate fragments tolerated
 * - Each session completes exactly once
 * - Bounded memory: sparse slots, pending-session cap, buffered-byte
 *   budget and idle timeout
 */

#pragma once

#include "meshdir/fragment.hpp"
#include "meshdir/node_config.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace meshdir {

/**
 * @brief Outcome of feeding one fragment
 */
enum class FeedStatus {
    ACCEPTED,           ///< Stored in an empty slot, message still incomplete
    DUPLICATE,          ///< Slot already filled, payload overwritten
    COMPLETED,          ///< Last missing slot filled, message returned
    ALREADY_COMPLETE,   ///< Session already delivered, fragment discarded
    MALFORMED,          ///< total == 0, index >= total, total or payload above limit
    TOTAL_MISMATCH,     ///< total disagrees with the session's total
    OVER_CAPACITY       ///< Byte budget exhausted by this session alone, session dropped
};

/**
 * @brief Convert FeedStatus to string
 */
std::string feed_status_to_string(FeedStatus status);

/**
 * @brief Result of FragmentAssembler::feed
 */
struct FeedResult {
    FeedStatus status;                              ///< What happened to the fragment
    std::optional<std::vector<uint8_t>> message;    ///< Reassembled message when COMPLETED

    bool completed() const { return status == FeedStatus::COMPLETED; }
    bool rejected() const {
        return status == FeedStatus::MALFORMED || status == FeedStatus::TOTAL_MISMATCH ||
               status == FeedStatus::OVER_CAPACITY;
    }
};

/**
 * @brief Assembler limits
 */
struct AssemblerConfig {
    size_t max_pending_sessions = config::DEFAULT_MAX_PENDING_SESSIONS;
    size_t completed_history = config::DEFAULT_COMPLETED_HISTORY;
    std::chrono::milliseconds session_idle_timeout = config::DEFAULT_SESSION_IDLE_TIMEOUT;
    size_t max_fragment_size = config::DEFAULT_FRAGMENT_SIZE;
    uint32_t max_fragments_per_message = config::max_fragments_for(config::DEFAULT_FRAGMENT_SIZE);
    size_t max_buffered_bytes = config::DEFAULT_MAX_BUFFERED_BYTES;

    static AssemblerConfig from_node_config(const NodeConfig& node_config);
};

/**
 * @brief FragmentAssembler - reconstructs messages from unordered fragments
 *
 * Eviction policy:
 * 1. Opening a session while max_pending_sessions incomplete sessions are
 *    tracked evicts the one with the oldest activity first
 * 2. evict_expired() drops incomplete sessions idle past the timeout
 * 3. Buffering a payload that would push the total over max_buffered_bytes
 *    evicts other sessions, oldest activity first
 * 4. Completed keys are remembered (up to completed_history, oldest
 *    forgotten first) so late fragments are discarded
 *
 * Slots are stored sparsely, so memory follows the bytes actually received
 * rather than the total announced by the first fragment.
 *
 * An evicted or forgotten key has reset semantics: its next fragment opens a
 * brand-new session.
 *
 * Not thread-safe: owned by a single node processing context.
 */
class FragmentAssembler {
public:
    using Clock = std::chrono::steady_clock;

    explicit FragmentAssembler(const AssemblerConfig& config = AssemblerConfig());

    /**
     * @brief Feed one fragment
     * @param fragment Fragment to store
     * @return Status, plus the reassembled message when the session completes
     */
    FeedResult feed(const Fragment& fragment);

    /**
     * @brief Feed one fragment with an explicit activity timestamp
     */
    FeedResult feed(const Fragment& fragment, Clock::time_point now);

    /**
     * @brief Drop incomplete sessions idle longer than the timeout
     * @param now Current time
     * @return Number of sessions evicted
     */
    size_t evict_expired(Clock::time_point now);

    size_t evict_expired() { return evict_expired(Clock::now()); }

    /// Number of incomplete sessions being tracked
    size_t pending_sessions() const { return pending_.size(); }

    /// Payload bytes held by incomplete sessions
    size_t buffered_bytes() const { return buffered_bytes_; }

    bool has_pending(const SessionKey& key) const;
    bool is_completed(const SessionKey& key) const;

    /**
     * @brief Filled slots of an incomplete session
     * @return Count, or 0 if the session is not pending
     */
    uint32_t received_fragments(const SessionKey& key) const;

    /// Drop every pending session and the completed history
    void clear();

    // Statistics
    uint64_t fragments_received() const { return fragments_received_; }
    uint64_t messages_completed() const { return messages_completed_; }
    uint64_t sessions_evicted() const { return sessions_evicted_; }
    uint64_t fragments_rejected() const { return fragments_rejected_; }

    const AssemblerConfig& config() const { return config_; }

private:
    struct PendingSession {
        uint32_t total = 0;
        std::map<uint32_t, std::vector<uint8_t>> slots;    // index -> payload, received only
        size_t total_bytes = 0;
        Clock::time_point last_activity;
    };

    AssemblerConfig config_;
    std::unordered_map<SessionKey, PendingSession> pending_;
    std::unordered_set<SessionKey> completed_;
    std::deque<SessionKey> completed_order_;
    size_t buffered_bytes_ = 0;

    uint64_t fragments_received_ = 0;
    uint64_t messages_completed_ = 0;
    uint64_t sessions_evicted_ = 0;
    uint64_t fragments_rejected_ = 0;

    void evict_oldest(const SessionKey* keep = nullptr);
    void drop_session(std::unordered_map<SessionKey, PendingSession>::iterator it);
    void remember_completed(const SessionKey& key);
    static std::vector<uint8_t> concatenate(const PendingSession& session);
};

} // namespace meshdir
