/**
 * @file neighbor_table.cpp
 * @brief Implementation of the neighbor table and channel-backed sinks
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/neighbor_table.hpp"

#include <stdexcept>

namespace meshdir {

// ============================================================================
// ChannelSink
// ============================================================================

ChannelSink::ChannelSink(std::shared_ptr<Channel<Fragment>> channel)
    : channel_(std::move(channel))
{
    if (!channel_) {
        throw std::invalid_argument("ChannelSink: channel must not be null");
    }
}

SendStatus ChannelSink::deliver(const Fragment& fragment) {
    return channel_->try_send(fragment);
}

// ============================================================================
// NeighborTable
// ============================================================================

bool NeighborTable::add(NodeId id, std::shared_ptr<FragmentSink> sink) {
    if (!sink) {
        throw std::invalid_argument("NeighborTable: sink for node " +
                                    std::to_string(static_cast<int>(id)) + " must not be null");
    }
    auto result = neighbors_.insert_or_assign(id, std::move(sink));
    return result.second;
}

bool NeighborTable::remove(NodeId id) {
    return neighbors_.erase(id) > 0;
}

std::shared_ptr<FragmentSink> NeighborTable::find(NodeId id) const {
    auto it = neighbors_.find(id);
    if (it == neighbors_.end()) {
        return nullptr;
    }
    return it->second;
}

bool NeighborTable::contains(NodeId id) const {
    return neighbors_.find(id) != neighbors_.end();
}

std::vector<NodeId> NeighborTable::ids() const {
    std::vector<NodeId> result;
    result.reserve(neighbors_.size());
    for (const auto& [id, sink] : neighbors_) {
        result.push_back(id);
    }
    return result;
}

} // namespace meshdir
