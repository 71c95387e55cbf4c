/**
 * @file content_client.hpp
 * @brief Client endpoint issuing directory requests over the overlay
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "meshdir/fragment.hpp"
#include "meshdir/message_types.hpp"
#include "meshdir/node_config.hpp"
#include "meshdir/routing_handler.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>

namespace meshdir {

/**
 * @brief A response matched to the request that caused it
 */
struct ClientReply {
    NodeId server;              ///< Node that answered
    uint64_t session_id;        ///< Session of the request
    WebRequest request;         ///< Original request
    WebResponse response;       ///< Decoded response
};

/**
 * @brief ContentClient - sends requests and correlates responses
 *
 * Pending requests are bounded: at most max_pending_sessions are tracked
 * (the oldest is dropped to make room), and expire_requests() drops those
 * unanswered for longer than session_idle_timeout.
 *
 * Not thread-safe: owned by one processing context.
 */
class ContentClient {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct client
     * @param id Client node identifier
     * @param config Routing configuration
     * @throws std::invalid_argument if config is invalid
     */
    explicit ContentClient(NodeId id, const NodeConfig& config = NodeConfig());

    /**
     * @brief Send a request to a directory node
     * @param server Destination node
     * @param request Request to send
     * @return Session id of the request, or std::nullopt if sending failed
     */
    std::optional<uint64_t> send_request(NodeId server, const WebRequest& request);

    /**
     * @brief Process an inbound fragment
     * @return Matched reply once a response is complete, std::nullopt otherwise
     */
    std::optional<ClientReply> handle_packet(const Fragment& fragment);

    /**
     * @brief Stop waiting for a response
     * @return true if the request was pending
     */
    bool forget(NodeId server, uint64_t session_id);

    /**
     * @brief Drop requests unanswered for longer than the timeout
     * @param now Current time
     * @return Number of requests dropped
     */
    size_t expire_requests(Clock::time_point now = Clock::now());

    /// Number of requests still waiting for a response
    size_t pending_requests() const { return pending_.size(); }

    bool is_pending(NodeId server, uint64_t session_id) const;

    RoutingHandler& routing() { return routing_; }

    NodeId id() const { return routing_.id(); }

private:
    struct PendingRequest {
        WebRequest request;
        Clock::time_point sent_at;
    };

    RoutingHandler routing_;
    size_t max_pending_;
    std::chrono::milliseconds request_timeout_;

    /// (server, session) -> request awaiting a response
    std::map<SessionKey, PendingRequest> pending_;

    void drop_oldest_request();
};

} // namespace meshdir
