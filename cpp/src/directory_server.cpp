/**
 * @file directory_server.cpp
 * @brief Implementation of the directory server for text and media nodes
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/directory_server.hpp"
#include "meshdir/node_config.hpp"
#include "meshdir/utilities.hpp"

namespace meshdir {

using namespace meshdir::utilities;

namespace {

template <typename T>
inline constexpr bool always_false = false;

std::string prefix(ServerType type) {
    return server_type_to_string(type) + ": ";
}

} // namespace

// ============================================================================
// Request handling
// ============================================================================

template <typename Record>
WebResponse DirectoryServer<Record>::lookup(const std::string& id) const {
    auto uuid = Uuid::parse(id);
    if (!uuid) {
        return response::ErrorInvalidId{id};
    }

    const Record* record = store_.get(*uuid);
    if (record == nullptr) {
        return response::ErrorNotFound{id};
    }

    auto json = record->to_json();
    if (!json) {
        return response::ErrorInternal{"failed to serialize record " + uuid->to_string()};
    }

    return response::Item{string_to_bytes(*json)};
}

template <typename Record>
WebResponse DirectoryServer<Record>::handle_request(const WebRequest& request) const {
    constexpr bool serves_text = std::is_same_v<Record, TextFile>;
    constexpr bool serves_media = std::is_same_v<Record, MediaFile>;

    return std::visit([&](const auto& req) -> WebResponse {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, request::ServerTypeQuery>) {
            return response::ServerTypeResponse{SERVER_TYPE};
        } else if constexpr (std::is_same_v<T, request::TextFilesListQuery>) {
            if constexpr (serves_text) {
                return response::ItemList{store_.list()};
            } else {
                return response::ErrorUnsupportedRequest{ProtocolCodec::request_name(request), SERVER_TYPE};
            }
        } else if constexpr (std::is_same_v<T, request::MediaFilesListQuery>) {
            if constexpr (serves_media) {
                return response::ItemList{store_.list()};
            } else {
                return response::ErrorUnsupportedRequest{ProtocolCodec::request_name(request), SERVER_TYPE};
            }
        } else if constexpr (std::is_same_v<T, request::FileQuery>) {
            if constexpr (serves_text) {
                return lookup(req.file_id);
            } else {
                return response::ErrorUnsupportedRequest{ProtocolCodec::request_name(request), SERVER_TYPE};
            }
        } else if constexpr (std::is_same_v<T, request::MediaQuery>) {
            if constexpr (serves_media) {
                return lookup(req.media_id);
            } else {
                return response::ErrorUnsupportedRequest{ProtocolCodec::request_name(request), SERVER_TYPE};
            }
        } else {
            static_assert(always_false<T>, "unhandled request type");
        }
    }, request);
}

template <typename Record>
std::optional<RoutingStatus> DirectoryServer<Record>::handle_message(
    const ReceivedMessage& message,
    RoutingHandler& routing
) {
    std::string origin = std::to_string(static_cast<int>(message.origin));

    if (message.data.size() > config::MAX_JSON_SIZE) {
        ++requests_dropped_;
        log_warn(prefix(SERVER_TYPE) + "Dropping oversized request (" +
                 format_byte_size(message.data.size()) + ") from node " + origin);
        return std::nullopt;
    }

    auto request = ProtocolCodec::decode_request(bytes_to_string(message.data));
    if (!request) {
        ++requests_dropped_;
        log_warn(prefix(SERVER_TYPE) + "Dropping undecodable request from node " + origin +
                 " (session " + std::to_string(message.session_id) + ")");
        return std::nullopt;
    }

    WebResponse response = handle_request(*request);
    log_debug(prefix(SERVER_TYPE) + ProtocolCodec::request_name(*request) + " from node " + origin +
              " -> " + ProtocolCodec::response_name(response));

    auto encoded = ProtocolCodec::encode_response(response);
    if (!encoded) {
        log_error(prefix(SERVER_TYPE) + "Cannot serialize " + ProtocolCodec::response_name(response) +
                  " for node " + origin + ", answering ErrorInternal");
        encoded = ProtocolCodec::encode_response(response::ErrorInternal{
            "failed to serialize " + ProtocolCodec::response_name(response)});
        if (!encoded) {
            ++requests_dropped_;
            return std::nullopt;
        }
    }

    RoutingStatus status = routing.send_message(string_to_bytes(*encoded), message.origin, message.session_id);
    if (status != RoutingStatus::OK) {
        ++reply_failures_;
        log_warn(prefix(SERVER_TYPE) + "Reply to node " + origin + " failed: " +
                 routing_status_to_string(status));
    } else {
        ++requests_answered_;
    }
    return status;
}

// ============================================================================
// Administrative operations
// ============================================================================

template <typename Record>
AdminResult DirectoryServer<Record>::list_items() const {
    return admin::Listing{store_.list()};
}

template <typename Record>
AdminResult DirectoryServer<Record>::get_item(const std::string& id) const {
    WebResponse response = lookup(id);

    if (auto* item = std::get_if<response::Item>(&response)) {
        return admin::Record{bytes_to_string(item->file_data)};
    }
    if (auto* invalid = std::get_if<response::ErrorInvalidId>(&response)) {
        return admin::InvalidId{invalid->id};
    }
    if (auto* missing = std::get_if<response::ErrorNotFound>(&response)) {
        return admin::NotFound{missing->id};
    }
    if (auto* internal = std::get_if<response::ErrorInternal>(&response)) {
        return admin::Failed{internal->reason};
    }
    return admin::Failed{"unexpected lookup response " + ProtocolCodec::response_name(response)};
}

template <typename Record>
AdminResult DirectoryServer<Record>::insert_item(Record record) {
    if (record.title.size() > config::MAX_TITLE_LENGTH) {
        return admin::Failed{"title exceeds " + std::to_string(config::MAX_TITLE_LENGTH) + " bytes"};
    }

    std::string id = record.id.to_string();
    bool created = store_.insert(std::move(record));
    log_info(prefix(SERVER_TYPE) + (created ? "Inserted " : "Replaced ") + id);
    return admin::Inserted{id, !created};
}

template <typename Record>
AdminResult DirectoryServer<Record>::remove_item(const std::string& id) {
    auto uuid = Uuid::parse(id);
    if (!uuid) {
        return admin::InvalidId{id};
    }

    if (!store_.remove(*uuid)) {
        return admin::NotFound{id};
    }

    log_info(prefix(SERVER_TYPE) + "Removed " + uuid->to_string());
    return admin::Removed{uuid->to_string()};
}

template <typename Record>
AdminResult DirectoryServer<Record>::unsupported(const AdminCommand& command) const {
    return admin::Unsupported{admin_command_name(command), SERVER_TYPE};
}

template <typename Record>
AdminResult DirectoryServer<Record>::handle_admin(const AdminCommand& command) {
    constexpr bool serves_text = std::is_same_v<Record, TextFile>;

    return std::visit([&](const auto& cmd) -> AdminResult {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, command::ListCachedItems>) {
            return list_items();
        } else if constexpr (std::is_same_v<T, command::GetItem>) {
            return get_item(cmd.id);
        } else if constexpr (std::is_same_v<T, command::ListTextItems>) {
            return serves_text ? list_items() : unsupported(command);
        } else if constexpr (std::is_same_v<T, command::GetTextItem>) {
            return serves_text ? get_item(cmd.id) : unsupported(command);
        } else if constexpr (std::is_same_v<T, command::ListMediaItems>) {
            return serves_text ? unsupported(command) : list_items();
        } else if constexpr (std::is_same_v<T, command::GetMediaItem>) {
            return serves_text ? unsupported(command) : get_item(cmd.id);
        } else if constexpr (std::is_same_v<T, command::InsertItem>) {
            if (const auto* record = std::get_if<Record>(&cmd.record)) {
                return insert_item(*record);
            }
            return unsupported(command);
        } else if constexpr (std::is_same_v<T, command::RemoveItem>) {
            return remove_item(cmd.id);
        } else {
            static_assert(always_false<T>, "unhandled admin command");
        }
    }, command);
}

template class DirectoryServer<TextFile>;
template class DirectoryServer<MediaFile>;

} // namespace meshdir
