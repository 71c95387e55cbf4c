/**
 * @file neighbor_table.hpp
 * @brief Outbound delivery handles of directly connected neighbors
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "meshdir/channel.hpp"
#include "meshdir/fragment.hpp"

#include <map>
#include <memory>
#include <vector>

namespace meshdir {

/**
 * @brief FragmentSink - outbound delivery capability toward one neighbor
 *
 * Implemented by the transport collaborator; tests substitute fakes.
 */
class FragmentSink {
public:
    virtual ~FragmentSink() = default;

    /**
     * @brief Hand a fragment to the neighbor
     * @return OK, or CLOSED / FULL if the neighbor cannot take it
     */
    virtual SendStatus deliver(const Fragment& fragment) = 0;
};

/**
 * @brief ChannelSink - delivers fragments into a neighbor's packet channel
 */
class ChannelSink : public FragmentSink {
public:
    explicit ChannelSink(std::shared_ptr<Channel<Fragment>> channel);

    SendStatus deliver(const Fragment& fragment) override;

    const std::shared_ptr<Channel<Fragment>>& channel() const { return channel_; }

private:
    std::shared_ptr<Channel<Fragment>> channel_;
};

/**
 * @brief NeighborTable - NodeId to outbound handle
 *
 * Mutated only by topology commands, read on every send. Not thread-safe.
 */
class NeighborTable {
public:
    /**
     * @brief Add or replace a neighbor
     * @return true if the neighbor was new, false if a handle was replaced
     */
    bool add(NodeId id, std::shared_ptr<FragmentSink> sink);

    /**
     * @brief Remove a neighbor
     * @return true if removed, false if it was unknown
     */
    bool remove(NodeId id);

    /**
     * @brief Look up a neighbor's handle
     * @return Handle or nullptr if unknown
     */
    std::shared_ptr<FragmentSink> find(NodeId id) const;

    bool contains(NodeId id) const;

    std::vector<NodeId> ids() const;

    size_t size() const { return neighbors_.size(); }

private:
    std::map<NodeId, std::shared_ptr<FragmentSink>> neighbors_;
};

} // namespace meshdir
