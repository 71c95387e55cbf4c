/**
 * @file directory_server.hpp
 * @brief Directory server answering content queries for one content kind
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A directory server owns the content store of its node and:
 * - Decodes reassembled requests and answers them through the routing layer
 * - Reports its server type and lists or returns stored records
 * - Rejects queries for the content kind it does not serve
 * - Executes administrative commands from the control channel
 */

#pragma once

#include "meshdir/content_store.hpp"
#include "meshdir/control.hpp"
#include "meshdir/message_types.hpp"
#include "meshdir/routing_handler.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace meshdir {

/**
 * @brief Application logic hosted by a ServerNode
 */
class ContentService {
public:
    virtual ~ContentService() = default;

    virtual ServerType server_type() const = 0;

    /**
     * @brief Answer a reassembled request message
     * @param message Request with origin and session correlation
     * @param routing Routing layer used to send the reply
     * @return Status of the reply send, or std::nullopt if the request was dropped
     */
    virtual std::optional<RoutingStatus> handle_message(
        const ReceivedMessage& message,
        RoutingHandler& routing
    ) = 0;

    /**
     * @brief Execute an administrative command
     */
    virtual AdminResult handle_admin(const AdminCommand& command) = 0;

    /// Number of stored records
    virtual size_t item_count() const = 0;
};

/**
 * @brief Compile-time description of a servable content kind
 */
template <typename Record>
struct ContentKind;

template <>
struct ContentKind<TextFile> {
    static constexpr ServerType server_type = ServerType::TEXT_SERVER;
};

template <>
struct ContentKind<MediaFile> {
    static constexpr ServerType server_type = ServerType::MEDIA_SERVER;
};

/**
 * @brief DirectoryServer - request handler for one content kind
 *
 * Instantiated for TextFile (TextServer) and MediaFile (MediaServer).
 * Not thread-safe: driven by a single node processing context.
 */
template <typename Record>
class DirectoryServer : public ContentService {
public:
    static constexpr ServerType SERVER_TYPE = ContentKind<Record>::server_type;

    DirectoryServer() = default;

    explicit DirectoryServer(ContentStore<Record> store)
        : store_(std::move(store))
    {}

    ServerType server_type() const override { return SERVER_TYPE; }

    /**
     * @brief Compute the response to a decoded request
     *
     * Never fails: lookup problems become explicit error responses.
     */
    WebResponse handle_request(const WebRequest& request) const;

    std::optional<RoutingStatus> handle_message(
        const ReceivedMessage& message,
        RoutingHandler& routing
    ) override;

    AdminResult handle_admin(const AdminCommand& command) override;

    size_t item_count() const override { return store_.size(); }

    // ========================================================================
    // Administrative operations
    // ========================================================================

    /// Sorted "id:title" summaries of the store
    AdminResult list_items() const;

    /// Serialized record for id, or NotFound / InvalidId
    AdminResult get_item(const std::string& id) const;

    /// Insert or replace a record; titles longer than MAX_TITLE_LENGTH fail
    AdminResult insert_item(Record record);

    /// Remove a record by id
    AdminResult remove_item(const std::string& id);

    ContentStore<Record>& store() { return store_; }
    const ContentStore<Record>& store() const { return store_; }

    // Statistics
    uint64_t requests_answered() const { return requests_answered_; }
    uint64_t requests_dropped() const { return requests_dropped_; }
    uint64_t reply_failures() const { return reply_failures_; }

private:
    ContentStore<Record> store_;

    uint64_t requests_answered_ = 0;
    uint64_t requests_dropped_ = 0;
    uint64_t reply_failures_ = 0;

    WebResponse lookup(const std::string& id) const;
    AdminResult unsupported(const AdminCommand& command) const;
};

extern template class DirectoryServer<TextFile>;
extern template class DirectoryServer<MediaFile>;

using TextServer = DirectoryServer<TextFile>;
using MediaServer = DirectoryServer<MediaFile>;

} // namespace meshdir
