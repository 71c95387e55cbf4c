/**
 * @file fragment.hpp
 * @brief Overlay fragment, source route and session key definitions
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every application message crossing the overlay is cut into fixed-size
 * fragments. A fragment names the node that produced the message, the
 * session the message belongs to, its position in the message and the
 * hop list it travels along.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshdir {

/// Overlay node identifier
using NodeId = uint8_t;

/**
 * @brief Source route carried by every fragment
 *
 * hops[0] is the node that produced the fragment, hops.back() the node it is
 * addressed to. hop_index points at the node currently holding the fragment.
 */
struct SourceRoute {
    size_t hop_index = 0;           ///< Index of the current holder in hops
    std::vector<NodeId> hops;       ///< Full path, origin first

    /// Route of a single hop from source to destination
    static SourceRoute direct(NodeId source, NodeId destination);

    bool empty() const { return hops.empty(); }

    std::optional<NodeId> source() const;
    std::optional<NodeId> destination() const;
    std::optional<NodeId> current_hop() const;
    std::optional<NodeId> next_hop() const;

    /**
     * @brief Path back to the source, as seen from the current holder
     *
     * Takes hops[0..hop_index] and reverses it, so the result starts at the
     * current holder and ends at the source.
     */
    SourceRoute reversed() const;

    std::string to_string() const;

    bool operator==(const SourceRoute& other) const {
        return hop_index == other.hop_index && hops == other.hops;
    }
};

/**
 * @brief One bounded-size piece of a logical message
 */
struct Fragment {
    NodeId origin = 0;                  ///< Node that produced the message
    uint64_t session_id = 0;            ///< Session shared by all fragments of the message
    uint32_t index = 0;                 ///< Position in the message, zero-based
    uint32_t total = 0;                 ///< Number of fragments in the message
    std::vector<uint8_t> payload;       ///< Fragment data
    SourceRoute route;                  ///< Hop list the fragment travels

    /// index < total and total >= 1
    bool is_well_formed() const { return total >= 1 && index < total; }

    /// Short human-readable header description for logs
    std::string describe() const;
};

/**
 * @brief Reassembly key: (origin, session id)
 */
struct SessionKey {
    NodeId origin = 0;
    uint64_t session_id = 0;

    bool operator==(const SessionKey& other) const {
        return origin == other.origin && session_id == other.session_id;
    }
    bool operator!=(const SessionKey& other) const { return !(*this == other); }
    bool operator<(const SessionKey& other) const {
        return origin != other.origin ? origin < other.origin : session_id < other.session_id;
    }

    std::string to_string() const;
};

} // namespace meshdir

namespace std {

template <>
struct hash<meshdir::SessionKey> {
    size_t operator()(const meshdir::SessionKey& key) const noexcept {
        return std::hash<uint64_t>()(key.session_id) ^
               (static_cast<size_t>(key.origin) * 0x9E3779B97F4A7C15ULL);
    }
};

} // namespace std
