/**
 * @file message_types.cpp
 * @brief Implementation of content records and protocol serialization
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/message_types.hpp"
#include "meshdir/codec.hpp"
#include "meshdir/utilities.hpp"

#include <nlohmann/json.hpp>
#include <type_traits>

using json = nlohmann::json;

namespace meshdir {

namespace {

template <typename T>
inline constexpr bool always_false = false;

std::optional<TextFile> text_from_object(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto id = Uuid::parse(j.at("id").get<std::string>());
    if (!id) {
        return std::nullopt;
    }

    TextFile file;
    file.id = *id;
    file.title = j.at("title").get<std::string>();
    file.content = j.at("content").get<std::string>();
    return file;
}

std::optional<MediaFile> media_from_object(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto id = Uuid::parse(j.at("id").get<std::string>());
    auto data = ByteCodec::base64_to_bytes(j.at("data").get<std::string>());
    if (!id || !data) {
        return std::nullopt;
    }

    MediaFile file;
    file.id = *id;
    file.title = j.at("title").get<std::string>();
    file.mime_type = j.value("mime_type", std::string("application/octet-stream"));
    file.data = std::move(*data);
    return file;
}

// Parses a JSON array with a per-element converter, counting failures
template <typename Record, typename Convert>
std::vector<Record> parse_record_array(const std::string& json_str, size_t* skipped, Convert convert) {
    std::vector<Record> records;
    size_t bad = 0;

    try {
        json j = json::parse(json_str);
        if (!j.is_array()) {
            utilities::log_warn("ContentRecords: Expected a JSON array of records");
        } else {
            for (const auto& element : j) {
                try {
                    auto record = convert(element);
                    if (record) {
                        records.push_back(std::move(*record));
                    } else {
                        ++bad;
                    }
                } catch (const std::exception&) {
                    ++bad;
                }
            }
        }
    } catch (const std::exception& e) {
        utilities::log_warn("ContentRecords: Failed to parse record list: " + std::string(e.what()));
    }

    if (bad > 0) {
        utilities::log_warn("ContentRecords: Skipped " + std::to_string(bad) + " invalid record(s)");
    }
    if (skipped != nullptr) {
        *skipped = bad;
    }
    return records;
}

} // namespace

// ============================================================================
// ServerType
// ============================================================================

std::string server_type_to_string(ServerType type) {
    switch (type) {
        case ServerType::TEXT_SERVER: return "TextServer";
        case ServerType::MEDIA_SERVER: return "MediaServer";
        default: return "Unknown";
    }
}

std::optional<ServerType> string_to_server_type(const std::string& str) {
    if (str == "TextServer") return ServerType::TEXT_SERVER;
    if (str == "MediaServer") return ServerType::MEDIA_SERVER;
    return std::nullopt;
}

// ============================================================================
// TextFile
// ============================================================================

std::string TextFile::summary() const {
    return id.to_string() + ":" + title;
}

std::optional<std::string> TextFile::to_json() const {
    try {
        json j;
        j["id"] = id.to_string();
        j["title"] = title;
        j["content"] = content;

        return j.dump();
    } catch (const std::exception& e) {
        utilities::log_error("TextFile: Cannot serialize " + id.to_string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<TextFile> TextFile::from_json(const std::string& json_str) {
    try {
        return text_from_object(json::parse(json_str));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<TextFile> TextFile::list_from_json(const std::string& json_str, size_t* skipped) {
    return parse_record_array<TextFile>(json_str, skipped, text_from_object);
}

// ============================================================================
// MediaFile
// ============================================================================

std::string MediaFile::summary() const {
    return id.to_string() + ":" + title;
}

std::optional<std::string> MediaFile::to_json() const {
    try {
        json j;
        j["id"] = id.to_string();
        j["title"] = title;
        j["mime_type"] = mime_type;
        j["data"] = ByteCodec::bytes_to_base64(data);

        return j.dump();
    } catch (const std::exception& e) {
        utilities::log_error("MediaFile: Cannot serialize " + id.to_string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<MediaFile> MediaFile::from_json(const std::string& json_str) {
    try {
        return media_from_object(json::parse(json_str));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<MediaFile> MediaFile::list_from_json(const std::string& json_str, size_t* skipped) {
    return parse_record_array<MediaFile>(json_str, skipped, media_from_object);
}

// ============================================================================
// Requests
// ============================================================================

std::string ProtocolCodec::request_name(const WebRequest& request) {
    return std::visit([](const auto& req) -> std::string {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, request::ServerTypeQuery>) return "ServerTypeQuery";
        else if constexpr (std::is_same_v<T, request::TextFilesListQuery>) return "TextFilesListQuery";
        else if constexpr (std::is_same_v<T, request::MediaFilesListQuery>) return "MediaFilesListQuery";
        else if constexpr (std::is_same_v<T, request::FileQuery>) return "FileQuery";
        else if constexpr (std::is_same_v<T, request::MediaQuery>) return "MediaQuery";
        else static_assert(always_false<T>, "unhandled request type");
    }, request);
}

std::string ProtocolCodec::encode_request(const WebRequest& request) {
    json j;
    j["type"] = request_name(request);

    std::visit([&j](const auto& req) {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, request::FileQuery>) {
            j["file_id"] = req.file_id;
        } else if constexpr (std::is_same_v<T, request::MediaQuery>) {
            j["media_id"] = req.media_id;
        }
    }, request);

    // Identifiers are plain text; replace invalid UTF-8 instead of throwing
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<WebRequest> ProtocolCodec::decode_request(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        std::string type = j.at("type").get<std::string>();

        if (type == "ServerTypeQuery") return WebRequest{request::ServerTypeQuery{}};
        if (type == "TextFilesListQuery") return WebRequest{request::TextFilesListQuery{}};
        if (type == "MediaFilesListQuery") return WebRequest{request::MediaFilesListQuery{}};
        if (type == "FileQuery") {
            return WebRequest{request::FileQuery{j.at("file_id").get<std::string>()}};
        }
        if (type == "MediaQuery") {
            return WebRequest{request::MediaQuery{j.at("media_id").get<std::string>()}};
        }

        return std::nullopt;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Responses
// ============================================================================

std::string ProtocolCodec::response_name(const WebResponse& response) {
    return std::visit([](const auto& res) -> std::string {
        using T = std::decay_t<decltype(res)>;
        if constexpr (std::is_same_v<T, response::ServerTypeResponse>) return "ServerType";
        else if constexpr (std::is_same_v<T, response::ItemList>) return "ItemList";
        else if constexpr (std::is_same_v<T, response::Item>) return "Item";
        else if constexpr (std::is_same_v<T, response::ErrorNotFound>) return "ErrorNotFound";
        else if constexpr (std::is_same_v<T, response::ErrorInvalidId>) return "ErrorInvalidId";
        else if constexpr (std::is_same_v<T, response::ErrorUnsupportedRequest>) return "ErrorUnsupportedRequest";
        else if constexpr (std::is_same_v<T, response::ErrorInternal>) return "ErrorInternal";
        else static_assert(always_false<T>, "unhandled response type");
    }, response);
}

std::optional<std::string> ProtocolCodec::encode_response(const WebResponse& response) {
    try {
        json j;
        j["type"] = response_name(response);

        std::visit([&j](const auto& res) {
            using T = std::decay_t<decltype(res)>;
            if constexpr (std::is_same_v<T, response::ServerTypeResponse>) {
                j["server_type"] = server_type_to_string(res.server_type);
            } else if constexpr (std::is_same_v<T, response::ItemList>) {
                j["items"] = res.items;
            } else if constexpr (std::is_same_v<T, response::Item>) {
                j["file_data"] = ByteCodec::bytes_to_base64(res.file_data);
            } else if constexpr (std::is_same_v<T, response::ErrorNotFound>) {
                j["id"] = res.id;
            } else if constexpr (std::is_same_v<T, response::ErrorInvalidId>) {
                j["id"] = res.id;
            } else if constexpr (std::is_same_v<T, response::ErrorUnsupportedRequest>) {
                j["request"] = res.request;
                j["server_type"] = server_type_to_string(res.server_type);
            } else if constexpr (std::is_same_v<T, response::ErrorInternal>) {
                j["reason"] = res.reason;
            }
        }, response);

        return j.dump();

    } catch (const std::exception& e) {
        utilities::log_error("ProtocolCodec: Failed to encode " + response_name(response) +
                             " response: " + e.what());
        return std::nullopt;
    }
}

std::optional<WebResponse> ProtocolCodec::decode_response(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        std::string type = j.at("type").get<std::string>();

        if (type == "ServerType") {
            auto server_type = string_to_server_type(j.at("server_type").get<std::string>());
            if (!server_type) {
                return std::nullopt;
            }
            return WebResponse{response::ServerTypeResponse{*server_type}};
        }
        if (type == "ItemList") {
            return WebResponse{response::ItemList{j.at("items").get<std::vector<std::string>>()}};
        }
        if (type == "Item") {
            auto data = ByteCodec::base64_to_bytes(j.at("file_data").get<std::string>());
            if (!data) {
                return std::nullopt;
            }
            return WebResponse{response::Item{std::move(*data)}};
        }
        if (type == "ErrorNotFound") {
            return WebResponse{response::ErrorNotFound{j.at("id").get<std::string>()}};
        }
        if (type == "ErrorInvalidId") {
            return WebResponse{response::ErrorInvalidId{j.at("id").get<std::string>()}};
        }
        if (type == "ErrorUnsupportedRequest") {
            auto server_type = string_to_server_type(j.at("server_type").get<std::string>());
            if (!server_type) {
                return std::nullopt;
            }
            return WebResponse{response::ErrorUnsupportedRequest{
                j.at("request").get<std::string>(), *server_type}};
        }
        if (type == "ErrorInternal") {
            return WebResponse{response::ErrorInternal{j.at("reason").get<std::string>()}};
        }

        return std::nullopt;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace meshdir
