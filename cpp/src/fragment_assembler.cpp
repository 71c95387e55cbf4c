/**
 * @file fragment_assembler.cpp
 * @brief Implementation of per-session fragment reassembly
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/fragment_assembler.hpp"
#include "meshdir/utilities.hpp"

#include <stdexcept>

namespace meshdir {

std::string feed_status_to_string(FeedStatus status) {
    switch (status) {
        case FeedStatus::ACCEPTED: return "ACCEPTED";
        case FeedStatus::DUPLICATE: return "DUPLICATE";
        case FeedStatus::COMPLETED: return "COMPLETED";
        case FeedStatus::ALREADY_COMPLETE: return "ALREADY_COMPLETE";
        case FeedStatus::MALFORMED: return "MALFORMED";
        case FeedStatus::TOTAL_MISMATCH: return "TOTAL_MISMATCH";
        case FeedStatus::OVER_CAPACITY: return "OVER_CAPACITY";
        default: return "UNKNOWN";
    }
}

AssemblerConfig AssemblerConfig::from_node_config(const NodeConfig& node_config) {
    AssemblerConfig cfg;
    cfg.max_pending_sessions = node_config.max_pending_sessions;
    cfg.completed_history = node_config.completed_history;
    cfg.session_idle_timeout = node_config.session_idle_timeout;
    cfg.max_fragment_size = node_config.max_fragment_size;
    if (node_config.max_fragment_size > 0) {
        cfg.max_fragments_per_message = config::max_fragments_for(node_config.max_fragment_size);
    }
    return cfg;
}

// ============================================================================
// Constructor
// ============================================================================

FragmentAssembler::FragmentAssembler(const AssemblerConfig& config)
    : config_(config)
{
    if (config_.max_pending_sessions == 0) {
        throw std::invalid_argument("FragmentAssembler: max_pending_sessions must be positive");
    }
    if (config_.max_fragment_size == 0) {
        throw std::invalid_argument("FragmentAssembler: max_fragment_size must be positive");
    }
}

// ============================================================================
// Feeding
// ============================================================================

FeedResult FragmentAssembler::feed(const Fragment& fragment) {
    return feed(fragment, Clock::now());
}

FeedResult FragmentAssembler::feed(const Fragment& fragment, Clock::time_point now) {
    ++fragments_received_;

    // Validate fragment header and payload size
    if (!fragment.is_well_formed() || fragment.total > config_.max_fragments_per_message ||
        fragment.payload.size() > config_.max_fragment_size) {
        ++fragments_rejected_;
        return {FeedStatus::MALFORMED, std::nullopt};
    }

    SessionKey key{fragment.origin, fragment.session_id};

    if (completed_.count(key) > 0) {
        return {FeedStatus::ALREADY_COMPLETE, std::nullopt};
    }

    auto it = pending_.find(key);
    if (it == pending_.end()) {
        if (pending_.size() >= config_.max_pending_sessions) {
            evict_oldest();
        }

        PendingSession session;
        session.total = fragment.total;
        it = pending_.emplace(key, std::move(session)).first;
    }

    PendingSession& session = it->second;

    // All fragments of one message must agree on total
    if (session.total != fragment.total) {
        ++fragments_rejected_;
        return {FeedStatus::TOTAL_MISMATCH, std::nullopt};
    }

    session.last_activity = now;

    auto slot = session.slots.find(fragment.index);
    FeedStatus status = slot == session.slots.end() ? FeedStatus::ACCEPTED : FeedStatus::DUPLICATE;
    size_t replaced = status == FeedStatus::DUPLICATE ? slot->second.size() : 0;

    // Make room under the byte budget at the expense of other sessions
    while (buffered_bytes_ - replaced + fragment.payload.size() > config_.max_buffered_bytes &&
           pending_.size() > 1) {
        evict_oldest(&key);
    }
    if (buffered_bytes_ - replaced + fragment.payload.size() > config_.max_buffered_bytes) {
        utilities::log_warn("FragmentAssembler: Session " + key.to_string() +
                            " exceeds the buffered byte budget, dropping it");
        drop_session(it);
        ++sessions_evicted_;
        ++fragments_rejected_;
        return {FeedStatus::OVER_CAPACITY, std::nullopt};
    }

    buffered_bytes_ -= replaced;
    session.total_bytes -= replaced;
    session.slots[fragment.index] = fragment.payload;
    session.total_bytes += fragment.payload.size();
    buffered_bytes_ += fragment.payload.size();

    if (session.slots.size() < session.total) {
        return {status, std::nullopt};
    }

    std::vector<uint8_t> message = concatenate(session);
    drop_session(it);
    remember_completed(key);
    ++messages_completed_;

    return {FeedStatus::COMPLETED, std::move(message)};
}

// ============================================================================
// Eviction
// ============================================================================

size_t FragmentAssembler::evict_expired(Clock::time_point now) {
    size_t removed = 0;

    for (auto it = pending_.begin(); it != pending_.end(); ) {
        if (now - it->second.last_activity > config_.session_idle_timeout) {
            utilities::log_debug("FragmentAssembler: Session " + it->first.to_string() +
                                 " idle, dropping " + std::to_string(it->second.slots.size()) +
                                 "/" + std::to_string(it->second.total) + " fragments");
            buffered_bytes_ -= it->second.total_bytes;
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    sessions_evicted_ += removed;
    return removed;
}

void FragmentAssembler::evict_oldest(const SessionKey* keep) {
    auto oldest = pending_.end();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (keep != nullptr && it->first == *keep) {
            continue;
        }
        if (oldest == pending_.end() || it->second.last_activity < oldest->second.last_activity) {
            oldest = it;
        }
    }

    if (oldest == pending_.end()) {
        return;
    }

    utilities::log_warn("FragmentAssembler: Pending limit reached, evicting session " +
                        oldest->first.to_string());
    drop_session(oldest);
    ++sessions_evicted_;
}

void FragmentAssembler::drop_session(std::unordered_map<SessionKey, PendingSession>::iterator it) {
    buffered_bytes_ -= it->second.total_bytes;
    pending_.erase(it);
}

void FragmentAssembler::remember_completed(const SessionKey& key) {
    if (config_.completed_history == 0) {
        return;
    }

    completed_.insert(key);
    completed_order_.push_back(key);

    while (completed_order_.size() > config_.completed_history) {
        completed_.erase(completed_order_.front());
        completed_order_.pop_front();
    }
}

std::vector<uint8_t> FragmentAssembler::concatenate(const PendingSession& session) {
    std::vector<uint8_t> result;
    result.reserve(session.total_bytes);

    for (const auto& slot : session.slots) {
        result.insert(result.end(), slot.second.begin(), slot.second.end());
    }

    return result;
}

// ============================================================================
// Queries
// ============================================================================

bool FragmentAssembler::has_pending(const SessionKey& key) const {
    return pending_.find(key) != pending_.end();
}

bool FragmentAssembler::is_completed(const SessionKey& key) const {
    return completed_.count(key) > 0;
}

uint32_t FragmentAssembler::received_fragments(const SessionKey& key) const {
    auto it = pending_.find(key);
    return it == pending_.end() ? 0 : static_cast<uint32_t>(it->second.slots.size());
}

void FragmentAssembler::clear() {
    pending_.clear();
    completed_.clear();
    completed_order_.clear();
    buffered_bytes_ = 0;
}

} // namespace meshdir
