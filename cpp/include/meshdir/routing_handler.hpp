/**
 * @file routing_handler.hpp
 * @brief Fragmenting send path and reassembling receive path of a node
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * RoutingHandler sits between the transport and the application protocol:
 * - Splits outgoing payloads into fixed-size fragments
 * - Picks a source route and hands fragments to the next-hop neighbor
 * - Remembers the reverse path of every inbound message
 * - Feeds inbound fragments to the FragmentAssembler
 */

#pragma once

#include "meshdir/fragment.hpp"
#include "meshdir/fragment_assembler.hpp"
#include "meshdir/neighbor_table.hpp"
#include "meshdir/node_config.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshdir {

/**
 * @brief Outcome of RoutingHandler::send_message
 */
enum class RoutingStatus {
    OK,                 ///< Every fragment handed to the next hop
    NO_ROUTE,           ///< No remembered path and destination is not a neighbor
    UNKNOWN_NEIGHBOR,   ///< Next hop of the selected path is not in the neighbor table
    CHANNEL_CLOSED,     ///< Next hop's channel is closed
    CHANNEL_FULL,       ///< Next hop's channel is full
    MESSAGE_TOO_LARGE   ///< Payload needs more fragments than a message may carry
};

/**
 * @brief Convert RoutingStatus to string
 */
std::string routing_status_to_string(RoutingStatus status);

/**
 * @brief A reassembled inbound message with its correlation data
 */
struct ReceivedMessage {
    NodeId origin;                  ///< Node that produced the message
    uint64_t session_id;            ///< Session to reuse when replying
    std::vector<uint8_t> data;      ///< Reassembled payload
};

/**
 * @brief RoutingHandler - per-node send/receive layer
 *
 * Not thread-safe: owned by a single node processing context.
 */
class RoutingHandler {
public:
    /**
     * @brief Construct routing layer for a node
     * @param id This node's identifier
     * @param config Fragment size and assembler limits
     * @throws std::invalid_argument if config is invalid
     */
    RoutingHandler(NodeId id, const NodeConfig& config = NodeConfig());

    NodeId id() const { return id_; }

    // ========================================================================
    // Topology
    // ========================================================================

    /**
     * @brief Add or replace a direct neighbor
     */
    void add_neighbor(NodeId neighbor, std::shared_ptr<FragmentSink> sink);

    /**
     * @brief Remove a direct neighbor (no-op if unknown)
     *
     * Remembered paths leaving through the neighbor are forgotten.
     */
    void remove_neighbor(NodeId neighbor);

    bool has_neighbor(NodeId neighbor) const { return neighbors_.contains(neighbor); }

    std::vector<NodeId> neighbors() const { return neighbors_.ids(); }

    // ========================================================================
    // Sending
    // ========================================================================

    /**
     * @brief Fragment a payload and send it toward destination
     * @param payload Message bytes
     * @param destination Node the message is addressed to
     * @param session_id Session id carried by every fragment
     * @return OK or the first failure; failures are not retried
     */
    RoutingStatus send_message(
        const std::vector<uint8_t>& payload,
        NodeId destination,
        uint64_t session_id
    );

    /**
     * @brief Path that send_message would use for destination
     * @return Route with hop_index 0, or std::nullopt if none is known
     */
    std::optional<SourceRoute> route_to(NodeId destination) const;

    /**
     * @brief Remember an explicit path to a node
     * @param route Path starting at this node
     * @return true if stored, false if the route does not start here
     */
    bool learn_route(const SourceRoute& route);

    // ========================================================================
    // Receiving
    // ========================================================================

    /**
     * @brief Process an inbound fragment
     * @param fragment Fragment delivered by the transport
     * @return Completed message, or std::nullopt if incomplete or dropped
     */
    std::optional<ReceivedMessage> handle_fragment(const Fragment& fragment);

    /**
     * @brief Drop reassembly sessions idle past the configured timeout
     * @return Number of sessions evicted
     */
    size_t evict_expired_sessions();

    FragmentAssembler& assembler() { return assembler_; }
    const FragmentAssembler& assembler() const { return assembler_; }

    size_t max_fragment_size() const { return max_fragment_size_; }

    // Statistics
    uint64_t fragments_sent() const { return fragments_sent_; }
    uint64_t failed_sends() const { return failed_sends_; }
    uint64_t dropped_fragments() const { return dropped_fragments_; }

    /**
     * @brief Split a payload into fragments of at most max_fragment_size bytes
     *
     * An empty payload yields one empty fragment.
     */
    static std::vector<Fragment> split_payload(
        const std::vector<uint8_t>& payload,
        NodeId origin,
        uint64_t session_id,
        size_t max_fragment_size
    );

private:
    NodeId id_;
    size_t max_fragment_size_;
    NeighborTable neighbors_;
    FragmentAssembler assembler_;

    /// Remembered paths (destination -> route starting here)
    std::map<NodeId, SourceRoute> routes_;

    uint64_t fragments_sent_ = 0;
    uint64_t failed_sends_ = 0;
    uint64_t dropped_fragments_ = 0;

    void remember_reverse_path(const Fragment& fragment);
};

} // namespace meshdir
