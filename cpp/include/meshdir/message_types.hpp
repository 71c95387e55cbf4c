/**
 * @file message_types.hpp
 * @brief Content records and application protocol messages
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All wire messages are JSON objects tagged by a "type" field:
 * - Requests: server type, list and item queries
 * - Responses: server type, item lists, items and explicit errors
 * - Content records: text and media files
 */

#pragma once

#include "meshdir/uuid.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace meshdir {

/**
 * @brief Role of a directory node; each node serves exactly one content kind
 */
enum class ServerType {
    TEXT_SERVER,        ///< Serves TextFile records
    MEDIA_SERVER        ///< Serves MediaFile records
};

/**
 * @brief Convert ServerType to its wire name ("TextServer", "MediaServer")
 */
std::string server_type_to_string(ServerType type);

/**
 * @brief Convert wire name to ServerType
 * @return ServerType or std::nullopt if invalid
 */
std::optional<ServerType> string_to_server_type(const std::string& str);

// ============================================================================
// Content records
// ============================================================================

/**
 * @brief Text document served by a text directory node
 */
struct TextFile {
    Uuid id;                    ///< Identifier chosen by the creator
    std::string title;          ///< Display title
    std::string content;        ///< Document body

    /// "id:title" listing entry
    std::string summary() const;

    /**
     * @brief Serialize record to JSON
     * @return JSON string, or std::nullopt if a field cannot be encoded
     */
    std::optional<std::string> to_json() const;

    /**
     * @brief Deserialize record from JSON
     * @return TextFile or std::nullopt if invalid
     */
    static std::optional<TextFile> from_json(const std::string& json);

    /**
     * @brief Parse a JSON array of records, skipping invalid entries
     * @param json JSON array
     * @param skipped Receives the number of skipped entries
     * @return Valid records, empty if the document is not an array
     */
    static std::vector<TextFile> list_from_json(const std::string& json, size_t* skipped = nullptr);
};

/**
 * @brief Binary media object served by a media directory node
 */
struct MediaFile {
    Uuid id;                    ///< Identifier chosen by the creator
    std::string title;          ///< Display title
    std::string mime_type;      ///< Content type, e.g. "image/png"
    std::vector<uint8_t> data;  ///< Raw media bytes (base64 on the wire)

    std::string summary() const;

    std::optional<std::string> to_json() const;
    static std::optional<MediaFile> from_json(const std::string& json);
    static std::vector<MediaFile> list_from_json(const std::string& json, size_t* skipped = nullptr);
};

/// A record of either content kind
using ContentRecord = std::variant<TextFile, MediaFile>;

// ============================================================================
// Requests
// ============================================================================

namespace request {

struct ServerTypeQuery {};

struct TextFilesListQuery {};

struct MediaFilesListQuery {};

struct FileQuery {
    std::string file_id;        ///< Text record identifier, unparsed
};

struct MediaQuery {
    std::string media_id;       ///< Media record identifier, unparsed
};

} // namespace request

using WebRequest = std::variant<
    request::ServerTypeQuery,
    request::TextFilesListQuery,
    request::MediaFilesListQuery,
    request::FileQuery,
    request::MediaQuery
>;

// ============================================================================
// Responses
// ============================================================================

namespace response {

struct ServerTypeResponse {
    ServerType server_type;
};

struct ItemList {
    std::vector<std::string> items;     ///< "id:title" summaries
};

struct Item {
    std::vector<uint8_t> file_data;     ///< JSON-serialized record
};

struct ErrorNotFound {
    std::string id;                     ///< Identifier as sent by the requester
};

struct ErrorInvalidId {
    std::string id;                     ///< The string that failed to parse
};

struct ErrorUnsupportedRequest {
    std::string request;                ///< Request type name
    ServerType server_type;             ///< Role of the answering node
};

struct ErrorInternal {
    std::string reason;
};

} // namespace response

using WebResponse = std::variant<
    response::ServerTypeResponse,
    response::ItemList,
    response::Item,
    response::ErrorNotFound,
    response::ErrorInvalidId,
    response::ErrorUnsupportedRequest,
    response::ErrorInternal
>;

/**
 * @brief Helper functions for protocol encoding
 */
class ProtocolCodec {
public:
    /**
     * @brief Encode request to JSON
     * @return JSON string
     */
    static std::string encode_request(const WebRequest& request);

    /**
     * @brief Decode request from JSON
     * @return WebRequest or std::nullopt if invalid
     */
    static std::optional<WebRequest> decode_request(const std::string& json);

    /**
     * @brief Encode response to JSON
     * @return JSON string, or std::nullopt if the response cannot be encoded
     */
    static std::optional<std::string> encode_response(const WebResponse& response);

    /**
     * @brief Decode response from JSON
     * @return WebResponse or std::nullopt if invalid
     */
    static std::optional<WebResponse> decode_response(const std::string& json);

    /// Wire type name of a request
    static std::string request_name(const WebRequest& request);

    /// Wire type name of a response
    static std::string response_name(const WebResponse& response);
};

} // namespace meshdir
