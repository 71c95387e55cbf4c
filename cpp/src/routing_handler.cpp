/**
 * @file routing_handler.cpp
 * @brief Implementation of the fragmenting send path and reassembling receive path
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/routing_handler.hpp"
#include "meshdir/utilities.hpp"

#include <algorithm>
#include <stdexcept>

namespace meshdir {

using namespace meshdir::utilities;

namespace {

std::string node_str(NodeId id) {
    return std::to_string(static_cast<int>(id));
}

RoutingStatus to_routing_status(SendStatus status) {
    switch (status) {
        case SendStatus::CLOSED: return RoutingStatus::CHANNEL_CLOSED;
        case SendStatus::FULL: return RoutingStatus::CHANNEL_FULL;
        default: return RoutingStatus::OK;
    }
}

} // namespace

std::string routing_status_to_string(RoutingStatus status) {
    switch (status) {
        case RoutingStatus::OK: return "OK";
        case RoutingStatus::NO_ROUTE: return "NO_ROUTE";
        case RoutingStatus::UNKNOWN_NEIGHBOR: return "UNKNOWN_NEIGHBOR";
        case RoutingStatus::CHANNEL_CLOSED: return "CHANNEL_CLOSED";
        case RoutingStatus::CHANNEL_FULL: return "CHANNEL_FULL";
        case RoutingStatus::MESSAGE_TOO_LARGE: return "MESSAGE_TOO_LARGE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Constructor
// ============================================================================

RoutingHandler::RoutingHandler(NodeId id, const NodeConfig& config)
    : id_(id)
    , max_fragment_size_(config.max_fragment_size)
    , assembler_(AssemblerConfig::from_node_config(config))
{
    std::string error;
    if (!config.validate(&error)) {
        throw std::invalid_argument("RoutingHandler: " + error);
    }
}

// ============================================================================
// Topology
// ============================================================================

void RoutingHandler::add_neighbor(NodeId neighbor, std::shared_ptr<FragmentSink> sink) {
    if (neighbors_.add(neighbor, std::move(sink))) {
        log_info("RoutingHandler[" + node_str(id_) + "]: Added neighbor " + node_str(neighbor));
    } else {
        log_info("RoutingHandler[" + node_str(id_) + "]: Replaced handle of neighbor " + node_str(neighbor));
    }
}

void RoutingHandler::remove_neighbor(NodeId neighbor) {
    if (!neighbors_.remove(neighbor)) {
        log_debug("RoutingHandler[" + node_str(id_) + "]: Remove of unknown neighbor " +
                  node_str(neighbor) + " ignored");
        return;
    }

    // Forget paths that leave through the removed neighbor
    for (auto it = routes_.begin(); it != routes_.end(); ) {
        auto next = it->second.next_hop();
        if (next && *next == neighbor) {
            it = routes_.erase(it);
        } else {
            ++it;
        }
    }

    log_info("RoutingHandler[" + node_str(id_) + "]: Removed neighbor " + node_str(neighbor));
}

// ============================================================================
// Route selection
// ============================================================================

std::optional<SourceRoute> RoutingHandler::route_to(NodeId destination) const {
    if (destination == id_) {
        return std::nullopt;
    }

    auto it = routes_.find(destination);
    if (it != routes_.end()) {
        auto next = it->second.next_hop();
        if (next && neighbors_.contains(*next)) {
            return it->second;
        }
    }

    if (neighbors_.contains(destination)) {
        return SourceRoute::direct(id_, destination);
    }

    // Stale remembered path: still reported so the caller sees the missing hop
    if (it != routes_.end()) {
        return it->second;
    }

    return std::nullopt;
}

bool RoutingHandler::learn_route(const SourceRoute& route) {
    if (route.hops.size() < 2 || route.hops.front() != id_) {
        return false;
    }

    SourceRoute stored = route;
    stored.hop_index = 0;
    routes_[stored.hops.back()] = std::move(stored);
    return true;
}

void RoutingHandler::remember_reverse_path(const Fragment& fragment) {
    if (fragment.route.hops.size() < 2) {
        return;
    }

    auto source = fragment.route.source();
    if (!source || *source != fragment.origin) {
        return;
    }

    learn_route(fragment.route.reversed());
}

// ============================================================================
// Sending
// ============================================================================

std::vector<Fragment> RoutingHandler::split_payload(
    const std::vector<uint8_t>& payload,
    NodeId origin,
    uint64_t session_id,
    size_t max_fragment_size
) {
    if (max_fragment_size == 0) {
        throw std::invalid_argument("RoutingHandler: max_fragment_size must be positive");
    }

    size_t count = std::max<size_t>(1, (payload.size() + max_fragment_size - 1) / max_fragment_size);

    std::vector<Fragment> fragments;
    fragments.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        size_t offset = i * max_fragment_size;
        size_t chunk = std::min(max_fragment_size, payload.size() - std::min(offset, payload.size()));

        Fragment fragment;
        fragment.origin = origin;
        fragment.session_id = session_id;
        fragment.index = static_cast<uint32_t>(i);
        fragment.total = static_cast<uint32_t>(count);
        fragment.payload.assign(
            payload.begin() + static_cast<std::ptrdiff_t>(offset),
            payload.begin() + static_cast<std::ptrdiff_t>(offset + chunk)
        );
        fragments.push_back(std::move(fragment));
    }

    return fragments;
}

RoutingStatus RoutingHandler::send_message(
    const std::vector<uint8_t>& payload,
    NodeId destination,
    uint64_t session_id
) {
    uint64_t needed = (static_cast<uint64_t>(payload.size()) + max_fragment_size_ - 1) / max_fragment_size_;
    if (needed > assembler_.config().max_fragments_per_message) {
        ++failed_sends_;
        log_error("RoutingHandler[" + node_str(id_) + "]: Message of " +
                  format_byte_size(payload.size()) + " exceeds fragment limit");
        return RoutingStatus::MESSAGE_TOO_LARGE;
    }

    auto route = route_to(destination);
    if (!route) {
        ++failed_sends_;
        log_warn("RoutingHandler[" + node_str(id_) + "]: No route to node " + node_str(destination));
        return RoutingStatus::NO_ROUTE;
    }

    route->hop_index = 1;
    NodeId next_hop = route->hops[1];

    auto sink = neighbors_.find(next_hop);
    if (!sink) {
        ++failed_sends_;
        log_warn("RoutingHandler[" + node_str(id_) + "]: Next hop " + node_str(next_hop) +
                 " toward node " + node_str(destination) + " is not a neighbor");
        return RoutingStatus::UNKNOWN_NEIGHBOR;
    }

    auto fragments = split_payload(payload, id_, session_id, max_fragment_size_);

    for (auto& fragment : fragments) {
        fragment.route = *route;

        SendStatus status = sink->deliver(fragment);
        if (status != SendStatus::OK) {
            ++failed_sends_;
            log_warn("RoutingHandler[" + node_str(id_) + "]: Delivery of " + fragment.describe() +
                     " to neighbor " + node_str(next_hop) + " failed: " + send_status_to_string(status));
            return to_routing_status(status);
        }
        ++fragments_sent_;
    }

    log_debug("RoutingHandler[" + node_str(id_) + "]: Sent session " + std::to_string(session_id) +
              " to node " + node_str(destination) + " in " + std::to_string(fragments.size()) +
              " fragment(s) via " + route->to_string());
    return RoutingStatus::OK;
}

// ============================================================================
// Receiving
// ============================================================================

std::optional<ReceivedMessage> RoutingHandler::handle_fragment(const Fragment& fragment) {
    // Fragments addressed elsewhere are the overlay's concern
    auto destination = fragment.route.destination();
    if (destination && *destination != id_) {
        ++dropped_fragments_;
        log_warn("RoutingHandler[" + node_str(id_) + "]: Dropping " + fragment.describe() +
                 " addressed to node " + node_str(*destination));
        return std::nullopt;
    }

    FeedResult result = assembler_.feed(fragment);

    switch (result.status) {
        case FeedStatus::MALFORMED:
        case FeedStatus::TOTAL_MISMATCH:
        case FeedStatus::OVER_CAPACITY:
            ++dropped_fragments_;
            log_warn("RoutingHandler[" + node_str(id_) + "]: Rejected " + fragment.describe() +
                     ": " + feed_status_to_string(result.status));
            return std::nullopt;

        case FeedStatus::ALREADY_COMPLETE:
            log_debug("RoutingHandler[" + node_str(id_) + "]: Discarding late " + fragment.describe());
            return std::nullopt;

        case FeedStatus::ACCEPTED:
        case FeedStatus::DUPLICATE:
            remember_reverse_path(fragment);
            return std::nullopt;

        case FeedStatus::COMPLETED:
            remember_reverse_path(fragment);
            break;
    }

    if (!result.message) {
        return std::nullopt;
    }

    return ReceivedMessage{fragment.origin, fragment.session_id, std::move(*result.message)};
}

size_t RoutingHandler::evict_expired_sessions() {
    size_t removed = assembler_.evict_expired();
    if (removed > 0) {
        log_info("RoutingHandler[" + node_str(id_) + "]: Evicted " + std::to_string(removed) +
                 " idle reassembly session(s)");
    }
    return removed;
}

} // namespace meshdir
