/**
 * @file content_client.cpp
 * @brief Implementation of the directory client
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/content_client.hpp"
#include "meshdir/codec.hpp"
#include "meshdir/utilities.hpp"

namespace meshdir {

using namespace meshdir::utilities;

ContentClient::ContentClient(NodeId id, const NodeConfig& config)
    : routing_(id, config)
    , max_pending_(config.max_pending_sessions)
    , request_timeout_(config.session_idle_timeout)
{
}

std::optional<uint64_t> ContentClient::send_request(NodeId server, const WebRequest& request) {
    uint64_t session_id = ByteCodec::random_u64();
    SessionKey key{server, session_id};

    // Session ids are random; a collision with a pending request is retried once
    if (pending_.count(key) > 0) {
        session_id = ByteCodec::random_u64();
        key = SessionKey{server, session_id};
    }

    std::string encoded = ProtocolCodec::encode_request(request);
    RoutingStatus status = routing_.send_message(string_to_bytes(encoded), server, session_id);
    if (status != RoutingStatus::OK) {
        log_warn("ContentClient[" + std::to_string(static_cast<int>(id())) + "]: " +
                 ProtocolCodec::request_name(request) + " to node " +
                 std::to_string(static_cast<int>(server)) + " failed: " + routing_status_to_string(status));
        return std::nullopt;
    }

    if (pending_.size() >= max_pending_) {
        drop_oldest_request();
    }
    pending_[key] = PendingRequest{request, Clock::now()};
    log_debug("ContentClient[" + std::to_string(static_cast<int>(id())) + "]: Sent " +
              ProtocolCodec::request_name(request) + " to node " +
              std::to_string(static_cast<int>(server)) + " (session " + std::to_string(session_id) + ")");
    return session_id;
}

std::optional<ClientReply> ContentClient::handle_packet(const Fragment& fragment) {
    auto message = routing_.handle_fragment(fragment);
    if (!message) {
        return std::nullopt;
    }

    SessionKey key{message->origin, message->session_id};
    auto it = pending_.find(key);
    if (it == pending_.end()) {
        log_warn("ContentClient[" + std::to_string(static_cast<int>(id())) +
                 "]: Dropping response for unknown session " + key.to_string());
        return std::nullopt;
    }

    auto response = ProtocolCodec::decode_response(bytes_to_string(message->data));
    if (!response) {
        log_warn("ContentClient[" + std::to_string(static_cast<int>(id())) +
                 "]: Undecodable response for session " + key.to_string());
        pending_.erase(it);
        return std::nullopt;
    }

    ClientReply reply{message->origin, message->session_id, std::move(it->second.request), std::move(*response)};
    pending_.erase(it);
    return reply;
}

bool ContentClient::forget(NodeId server, uint64_t session_id) {
    return pending_.erase(SessionKey{server, session_id}) > 0;
}

size_t ContentClient::expire_requests(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = pending_.begin(); it != pending_.end(); ) {
        if (now - it->second.sent_at > request_timeout_) {
            log_debug("ContentClient[" + std::to_string(static_cast<int>(id())) + "]: " +
                      ProtocolCodec::request_name(it->second.request) + " session " +
                      it->first.to_string() + " timed out");
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ContentClient::drop_oldest_request() {
    auto oldest = pending_.begin();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.sent_at < oldest->second.sent_at) {
            oldest = it;
        }
    }
    if (oldest == pending_.end()) {
        return;
    }

    log_warn("ContentClient[" + std::to_string(static_cast<int>(id())) +
             "]: Pending request limit reached, dropping session " + oldest->first.to_string());
    pending_.erase(oldest);
}

bool ContentClient::is_pending(NodeId server, uint64_t session_id) const {
    return pending_.count(SessionKey{server, session_id}) > 0;
}

} // namespace meshdir
