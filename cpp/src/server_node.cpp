/**
 * @file server_node.cpp
 * @brief Implementation of the directory node runtime
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/server_node.hpp"
#include "meshdir/utilities.hpp"

#include <stdexcept>
#include <type_traits>

namespace meshdir {

using namespace meshdir::utilities;

// ============================================================================
// Constructor / Destructor
// ============================================================================

ServerNode::ServerNode(
    const NodeConfig& config,
    NodeId id,
    std::unique_ptr<ContentService> service,
    std::shared_ptr<Channel<Fragment>> packets,
    std::shared_ptr<Channel<ControlCommand>> control,
    std::shared_ptr<Channel<NodeEvent>> events
)
    : config_(config)
    , id_(id)
    , service_(std::move(service))
    , packets_(std::move(packets))
    , control_(std::move(control))
    , events_(std::move(events))
    , routing_(id, config)
    , state_(NodeState::RUNNING)
    , started_(false)
    , turn_scheduled_(false)
    , sweep_timer_(io_context_)
{
    if (!service_ || !packets_ || !control_ || !events_) {
        throw std::invalid_argument("ServerNode: service and channels must not be null");
    }

    log_info("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Created " +
             server_type_to_string(service_->server_type()) + " with " +
             std::to_string(service_->item_count()) + " item(s)");
}

ServerNode::~ServerNode() {
    // Returns only after producers have left any listener call into this node
    packets_->set_listener(nullptr);
    control_->set_listener(nullptr);

    if (state_ == NodeState::RUNNING) {
        stop();
    }
    wait();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool ServerNode::start() {
    if (state_ != NodeState::RUNNING) {
        log_warn("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Cannot start a terminated node");
        return false;
    }
    if (started_.exchange(true)) {
        log_warn("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Already started");
        return false;
    }

    // Keep io_context alive while waiting for channel activity
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    packets_->set_listener([this]() { schedule_turn(); });
    control_->set_listener([this]() { schedule_turn(); });

    schedule_sweep();

    // Inputs queued before start
    schedule_turn();

    worker_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            log_error("ServerNode[" + std::to_string(static_cast<int>(id_)) +
                      "]: Worker thread exception: " + std::string(e.what()));
        }
    });

    log_info("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Started");
    return true;
}

void ServerNode::wait() {
    if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) {
        worker_thread_.join();
    }
}

void ServerNode::stop() {
    if (state_ != NodeState::RUNNING) {
        return;
    }

    if (started_) {
        // Node state belongs to the processing context
        asio::post(io_context_, [this]() { terminate(); });
    } else {
        terminate();
    }
}

void ServerNode::terminate() {
    if (state_.exchange(NodeState::TERMINATED) == NodeState::TERMINATED) {
        return;
    }

    size_t discarded = routing_.assembler().pending_sessions();
    log_info("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Shutting down (" +
             std::to_string(discarded) + " partial message(s) and " +
             std::to_string(packets_->size()) + " queued fragment(s) discarded)");

    packets_->close();
    control_->close();
    routing_.assembler().clear();

    publish(NodeTerminated{id_});

    sweep_timer_.cancel();
    work_guard_.reset();
    io_context_.stop();
}

// ============================================================================
// Scheduling
// ============================================================================

void ServerNode::schedule_turn() {
    if (turn_scheduled_.exchange(true)) {
        return;
    }

    asio::post(io_context_, [this]() {
        turn_scheduled_ = false;
        if (state_ != NodeState::RUNNING) {
            return;
        }
        if (run_turn()) {
            schedule_turn();
        }
    });
}

void ServerNode::schedule_sweep() {
    sweep_timer_.expires_after(config_.sweep_interval);
    sweep_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || state_ != NodeState::RUNNING) {
            return;
        }
        routing_.evict_expired_sessions();
        schedule_sweep();
    });
}

bool ServerNode::run_turn() {
    // Control first: topology and admin changes apply before data
    while (state_ == NodeState::RUNNING) {
        auto command = control_->try_receive();
        if (!command) {
            break;
        }

        bool must_terminate = false;
        try {
            must_terminate = handle_command(*command);
        } catch (const std::exception& e) {
            log_error("ServerNode[" + std::to_string(static_cast<int>(id_)) +
                      "]: Command failed: " + std::string(e.what()));
        }

        if (must_terminate) {
            terminate();
            return false;
        }
    }

    if (state_ != NodeState::RUNNING) {
        return false;
    }

    auto fragment = packets_->try_receive();
    if (fragment) {
        try {
            handle_packet(*fragment);
        } catch (const std::exception& e) {
            log_error("ServerNode[" + std::to_string(static_cast<int>(id_)) +
                      "]: Failed to process " + fragment->describe() + ": " + std::string(e.what()));
        }
    }

    return state_ == NodeState::RUNNING && !packets_->empty();
}

// ============================================================================
// Handlers
// ============================================================================

bool ServerNode::handle_command(const ControlCommand& command) {
    return std::visit([this](const auto& cmd) -> bool {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, TopologyCommand>) {
            return apply_topology(cmd);
        } else {
            apply_admin(cmd);
            return false;
        }
    }, command);
}

bool ServerNode::apply_topology(const TopologyCommand& command) {
    if (const auto* add = std::get_if<command::AddNeighbor>(&command)) {
        routing_.add_neighbor(add->id, add->sink);
        return false;
    }
    if (const auto* remove = std::get_if<command::RemoveNeighbor>(&command)) {
        routing_.remove_neighbor(remove->id);
        return false;
    }

    log_info("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: Shutdown requested");
    return true;
}

void ServerNode::apply_admin(const AdminCommand& command) {
    std::string name = admin_command_name(command);
    AdminResult result = service_->handle_admin(command);

    log_debug("ServerNode[" + std::to_string(static_cast<int>(id_)) + "]: " + name +
              " -> " + describe_admin_result(result));
    publish(AdminReply{name, std::move(result)});
}

void ServerNode::handle_packet(const Fragment& fragment) {
    auto message = routing_.handle_fragment(fragment);
    if (!message) {
        return;
    }

    service_->handle_message(*message, routing_);
}

void ServerNode::publish(NodeEvent event) {
    SendStatus status = events_->try_send(std::move(event));
    if (status != SendStatus::OK) {
        log_warn("ServerNode[" + std::to_string(static_cast<int>(id_)) +
                 "]: Event dropped: " + send_status_to_string(status));
    }
}

} // namespace meshdir
