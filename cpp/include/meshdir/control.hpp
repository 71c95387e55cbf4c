/**
 * @file control.hpp
 * @brief Control-plane commands accepted by a node and events it publishes
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Control commands never travel through the overlay:
 * - Topology commands change the neighbor set or stop the node
 * - Administrative commands inspect and edit the content store
 */

#pragma once

#include "meshdir/fragment.hpp"
#include "meshdir/message_types.hpp"
#include "meshdir/neighbor_table.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace meshdir {

// ============================================================================
// Commands
// ============================================================================

namespace command {

struct AddNeighbor {
    NodeId id;
    std::shared_ptr<FragmentSink> sink;     ///< Outbound handle for the neighbor
};

struct RemoveNeighbor {
    NodeId id;
};

struct Shutdown {};

struct ListCachedItems {};

struct GetItem {
    std::string id;
};

struct ListTextItems {};

struct GetTextItem {
    std::string id;
};

struct ListMediaItems {};

struct GetMediaItem {
    std::string id;
};

struct InsertItem {
    ContentRecord record;
};

struct RemoveItem {
    std::string id;
};

} // namespace command

using TopologyCommand = std::variant<
    command::AddNeighbor,
    command::RemoveNeighbor,
    command::Shutdown
>;

using AdminCommand = std::variant<
    command::ListCachedItems,
    command::GetItem,
    command::ListTextItems,
    command::GetTextItem,
    command::ListMediaItems,
    command::GetMediaItem,
    command::InsertItem,
    command::RemoveItem
>;

using ControlCommand = std::variant<TopologyCommand, AdminCommand>;

/**
 * @brief Name of an administrative command, e.g. "GetTextItem"
 */
std::string admin_command_name(const AdminCommand& command);

// ============================================================================
// Administrative results
// ============================================================================

namespace admin {

struct Listing {
    std::vector<std::string> items;     ///< Sorted "id:title" summaries
};

struct Record {
    std::string json;                   ///< Serialized record
};

struct NotFound {
    std::string id;
};

struct InvalidId {
    std::string id;
};

struct Inserted {
    std::string id;
    bool replaced;                      ///< An entry with the same id existed
};

struct Removed {
    std::string id;
};

struct Unsupported {
    std::string command;
    ServerType server_type;
};

struct Failed {
    std::string reason;
};

} // namespace admin

using AdminResult = std::variant<
    admin::Listing,
    admin::Record,
    admin::NotFound,
    admin::InvalidId,
    admin::Inserted,
    admin::Removed,
    admin::Unsupported,
    admin::Failed
>;

/**
 * @brief One-line description of an administrative result for logs
 */
std::string describe_admin_result(const AdminResult& result);

// ============================================================================
// Node events
// ============================================================================

struct AdminReply {
    std::string command;
    AdminResult result;
};

struct NodeTerminated {
    NodeId id;
};

using NodeEvent = std::variant<AdminReply, NodeTerminated>;

} // namespace meshdir
