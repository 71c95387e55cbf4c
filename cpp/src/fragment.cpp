/**
 * @file fragment.cpp
 * @brief Source route navigation and fragment descriptions
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/fragment.hpp"

#include <algorithm>
#include <sstream>

namespace meshdir {

// ============================================================================
// SourceRoute
// ============================================================================

SourceRoute SourceRoute::direct(NodeId source, NodeId destination) {
    SourceRoute route;
    route.hop_index = 0;
    route.hops = {source, destination};
    return route;
}

std::optional<NodeId> SourceRoute::source() const {
    if (hops.empty()) {
        return std::nullopt;
    }
    return hops.front();
}

std::optional<NodeId> SourceRoute::destination() const {
    if (hops.empty()) {
        return std::nullopt;
    }
    return hops.back();
}

std::optional<NodeId> SourceRoute::current_hop() const {
    if (hop_index >= hops.size()) {
        return std::nullopt;
    }
    return hops[hop_index];
}

std::optional<NodeId> SourceRoute::next_hop() const {
    if (hop_index + 1 >= hops.size()) {
        return std::nullopt;
    }
    return hops[hop_index + 1];
}

SourceRoute SourceRoute::reversed() const {
    SourceRoute back;
    if (hops.empty()) {
        return back;
    }

    size_t last = std::min(hop_index, hops.size() - 1);
    back.hops.assign(hops.begin(), hops.begin() + static_cast<std::ptrdiff_t>(last) + 1);
    std::reverse(back.hops.begin(), back.hops.end());
    back.hop_index = 0;
    return back;
}

std::string SourceRoute::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < hops.size(); ++i) {
        if (i > 0) {
            oss << " -> ";
        }
        if (i == hop_index) {
            oss << "*";
        }
        oss << static_cast<int>(hops[i]);
    }
    oss << "]";
    return oss.str();
}

// ============================================================================
// Fragment / SessionKey
// ============================================================================

std::string Fragment::describe() const {
    std::ostringstream oss;
    oss << "fragment " << index << "/" << total
        << " of session " << session_id
        << " from node " << static_cast<int>(origin)
        << " (" << payload.size() << " bytes, route " << route.to_string() << ")";
    return oss.str();
}

std::string SessionKey::to_string() const {
    return "(" + std::to_string(static_cast<int>(origin)) + ", " + std::to_string(session_id) + ")";
}

} // namespace meshdir
