/**
 * @file overlay_demo.cpp
 * @brief Overlay demonstration - a client querying text and media nodes
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Launching a text node and a media node on their own processing threads
 * - Wiring neighbors through bounded channels
 * - Fragmented request/response exchange with session correlation
 * - Administrative commands over the control channel
 *
 * Usage: overlay_demo [text_records.json]
 */

#include "meshdir/channel.hpp"
#include "meshdir/codec.hpp"
#include "meshdir/content_client.hpp"
#include "meshdir/control.hpp"
#include "meshdir/directory_server.hpp"
#include "meshdir/server_node.hpp"
#include "meshdir/utilities.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

using namespace meshdir;
using namespace std::chrono_literals;

namespace {

constexpr NodeId CLIENT_ID = 1;
constexpr NodeId TEXT_NODE_ID = 10;
constexpr NodeId MEDIA_NODE_ID = 20;

std::string describe_response(const WebResponse& response) {
    return std::visit([](const auto& res) -> std::string {
        using T = std::decay_t<decltype(res)>;
        if constexpr (std::is_same_v<T, response::ServerTypeResponse>) {
            return "ServerType: " + server_type_to_string(res.server_type);
        } else if constexpr (std::is_same_v<T, response::ItemList>) {
            std::string out = "ItemList (" + std::to_string(res.items.size()) + ")";
            for (const auto& item : res.items) {
                out += "\n      - " + item;
            }
            return out;
        } else if constexpr (std::is_same_v<T, response::Item>) {
            return "Item: " + utilities::bytes_to_string(res.file_data);
        } else if constexpr (std::is_same_v<T, response::ErrorNotFound>) {
            return "ErrorNotFound: " + res.id;
        } else if constexpr (std::is_same_v<T, response::ErrorInvalidId>) {
            return "ErrorInvalidId: " + res.id;
        } else if constexpr (std::is_same_v<T, response::ErrorUnsupportedRequest>) {
            return "ErrorUnsupportedRequest: " + res.request + " on " + server_type_to_string(res.server_type);
        } else {
            return "ErrorInternal: " + res.reason;
        }
    }, response);
}

ContentStore<TextFile> sample_text_store(int argc, char** argv) {
    ContentStore<TextFile> store;

    if (argc > 1) {
        std::ifstream file(argv[1]);
        if (!file) {
            utilities::log_warn("overlay_demo: Cannot open " + std::string(argv[1]));
        } else {
            std::stringstream buffer;
            buffer << file.rdbuf();
            store.load_records(buffer.str());
        }
    }

    if (store.empty()) {
        store.insert(TextFile{Uuid::generate_v4(), "Overlay basics",
                              "Nodes forward fragments along source routes."});
        store.insert(TextFile{Uuid::generate_v4(), "Reassembly",
                              std::string(600, 'x')});
    }
    return store;
}

ContentStore<MediaFile> sample_media_store() {
    ContentStore<MediaFile> store;
    store.insert(MediaFile{Uuid::generate_v4(), "Logo", "image/png",
                           {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}});
    return store;
}

void send_control(Channel<ControlCommand>& channel, ControlCommand command) {
    SendStatus status = channel.try_send(std::move(command));
    if (status != SendStatus::OK) {
        utilities::log_error("overlay_demo: Control command dropped: " + send_status_to_string(status));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Log configuration problems before the configured level applies
        utilities::initialize_logging();
        NodeConfig config = NodeConfig::from_environment();
        utilities::set_log_level(config.log_level);

        if (!ByteCodec::initialize()) {
            std::cerr << "Failed to initialize libsodium\n";
            return 1;
        }

        std::cout << "MeshDir overlay demonstration\n\n";

        // Channels
        auto client_packets = std::make_shared<Channel<Fragment>>(config.channel_capacity);
        auto text_packets = std::make_shared<Channel<Fragment>>(config.channel_capacity);
        auto media_packets = std::make_shared<Channel<Fragment>>(config.channel_capacity);
        auto text_control = std::make_shared<Channel<ControlCommand>>(config.channel_capacity);
        auto media_control = std::make_shared<Channel<ControlCommand>>(config.channel_capacity);
        auto text_events = std::make_shared<Channel<NodeEvent>>(config.channel_capacity);
        auto media_events = std::make_shared<Channel<NodeEvent>>(config.channel_capacity);

        // Nodes
        auto text_store = sample_text_store(argc, argv);
        auto records = text_store.all();

        ServerNode text_node(config, TEXT_NODE_ID,
                             std::make_unique<TextServer>(std::move(text_store)),
                             text_packets, text_control, text_events);
        ServerNode media_node(config, MEDIA_NODE_ID,
                              std::make_unique<MediaServer>(sample_media_store()),
                              media_packets, media_control, media_events);

        ContentClient client(CLIENT_ID, config);
        client.routing().add_neighbor(TEXT_NODE_ID, std::make_shared<ChannelSink>(text_packets));
        client.routing().add_neighbor(MEDIA_NODE_ID, std::make_shared<ChannelSink>(media_packets));

        auto to_client = std::make_shared<ChannelSink>(client_packets);
        send_control(*text_control, TopologyCommand{command::AddNeighbor{CLIENT_ID, to_client}});
        send_control(*media_control, TopologyCommand{command::AddNeighbor{CLIENT_ID, to_client}});

        text_node.start();
        media_node.start();

        // Requests
        std::vector<std::pair<NodeId, WebRequest>> requests = {
            {TEXT_NODE_ID, request::ServerTypeQuery{}},
            {TEXT_NODE_ID, request::TextFilesListQuery{}},
            {TEXT_NODE_ID, request::FileQuery{"not-a-uuid"}},
            {TEXT_NODE_ID, request::FileQuery{Uuid::generate_v4().to_string()}},
            {TEXT_NODE_ID, request::MediaQuery{Uuid::generate_v4().to_string()}},
            {MEDIA_NODE_ID, request::ServerTypeQuery{}},
            {MEDIA_NODE_ID, request::MediaFilesListQuery{}},
        };
        if (!records.empty()) {
            requests.emplace_back(TEXT_NODE_ID, request::FileQuery{records.front().id.to_string()});
        }

        size_t sent = 0;
        for (const auto& [server, req] : requests) {
            if (client.send_request(server, req)) {
                ++sent;
            }
        }

        size_t received = 0;
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (received < sent && std::chrono::steady_clock::now() < deadline) {
            auto fragment = client_packets->receive_for(100ms);
            if (!fragment) {
                continue;
            }
            auto reply = client.handle_packet(*fragment);
            if (!reply) {
                continue;
            }
            ++received;
            std::cout << "  node " << static_cast<int>(reply->server) << " "
                      << ProtocolCodec::request_name(reply->request) << "\n"
                      << "    -> " << describe_response(reply->response) << "\n";
        }
        std::cout << "\nReceived " << received << " of " << sent << " responses\n";
        if (size_t lost = client.expire_requests(std::chrono::steady_clock::now() + config.session_idle_timeout)) {
            std::cout << "Gave up on " << lost << " unanswered request(s)\n";
        }
        std::cout << "\n";

        // Administration
        send_control(*text_control, AdminCommand{command::ListCachedItems{}});
        send_control(*text_control, AdminCommand{command::ListMediaItems{}});
        for (int i = 0; i < 2; ++i) {
            auto event = text_events->receive_for(1s);
            if (!event) {
                break;
            }
            if (const auto* reply = std::get_if<AdminReply>(&*event)) {
                std::cout << "  admin " << reply->command << " -> "
                          << describe_admin_result(reply->result) << "\n";
            }
        }

        // Shutdown
        send_control(*text_control, TopologyCommand{command::Shutdown{}});
        send_control(*media_control, TopologyCommand{command::Shutdown{}});
        text_node.wait();
        media_node.wait();

        std::cout << "\nAll nodes terminated\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
