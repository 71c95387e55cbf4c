/**
 * @file server_node.hpp
 * @brief Directory node runtime: channels, processing context and sweep timer
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ServerNode wires a content service to the overlay:
 * - Consumes fragments from its packet channel
 * - Consumes topology and administrative commands from its control channel
 * - Publishes administrative results and termination on its event channel
 * - Periodically evicts idle reassembly sessions
 *
 * All node state is touched from a single asio io_context run by one
 * worker thread.
 */

#pragma once

#include "meshdir/channel.hpp"
#include "meshdir/control.hpp"
#include "meshdir/directory_server.hpp"
#include "meshdir/fragment.hpp"
#include "meshdir/node_config.hpp"
#include "meshdir/routing_handler.hpp"

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <thread>

namespace meshdir {

/**
 * @brief Lifecycle state of a node
 */
enum class NodeState {
    RUNNING,
    TERMINATED
};

/**
 * @brief ServerNode - one directory node of the overlay
 */
class ServerNode {
public:
    /**
     * @brief Construct node
     * @param config Routing and timing configuration
     * @param id Node identifier
     * @param service Content service answering requests
     * @param packets Inbound fragment channel
     * @param control Inbound control channel
     * @param events Outbound event channel
     * @throws std::invalid_argument on null arguments or invalid config
     */
    ServerNode(
        const NodeConfig& config,
        NodeId id,
        std::unique_ptr<ContentService> service,
        std::shared_ptr<Channel<Fragment>> packets,
        std::shared_ptr<Channel<ControlCommand>> control,
        std::shared_ptr<Channel<NodeEvent>> events
    );

    /**
     * @brief Destructor - stops the worker thread
     */
    ~ServerNode();

    ServerNode(const ServerNode&) = delete;
    ServerNode& operator=(const ServerNode&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start processing on a dedicated worker thread
     * @return true if started, false if already started or terminated
     */
    bool start();

    /**
     * @brief Block until the worker thread exits
     */
    void wait();

    /**
     * @brief Terminate as if a Shutdown command had been received
     */
    void stop();

    NodeState state() const { return state_; }
    bool is_running() const { return state_ == NodeState::RUNNING; }

    // ========================================================================
    // Synchronous entry points
    // ========================================================================

    /**
     * @brief Apply one control command
     * @return true when the node must terminate
     */
    bool handle_command(const ControlCommand& command);

    /**
     * @brief Process one inbound fragment
     */
    void handle_packet(const Fragment& fragment);

    /**
     * @brief One processing turn: all pending commands, then at most one packet
     * @return true if more packets remain
     */
    bool run_turn();

    NodeId id() const { return id_; }
    RoutingHandler& routing() { return routing_; }
    const ContentService& service() const { return *service_; }

private:
    NodeConfig config_;
    NodeId id_;
    std::unique_ptr<ContentService> service_;
    std::shared_ptr<Channel<Fragment>> packets_;
    std::shared_ptr<Channel<ControlCommand>> control_;
    std::shared_ptr<Channel<NodeEvent>> events_;
    RoutingHandler routing_;

    std::atomic<NodeState> state_;
    std::atomic<bool> started_;
    std::atomic<bool> turn_scheduled_;

    // ASIO runtime
    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    asio::steady_timer sweep_timer_;
    std::thread worker_thread_;

    void schedule_turn();
    void schedule_sweep();
    void terminate();
    void publish(NodeEvent event);

    bool apply_topology(const TopologyCommand& command);
    void apply_admin(const AdminCommand& command);
};

} // namespace meshdir
