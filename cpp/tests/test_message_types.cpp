/**
 * @file test_message_types.cpp
 * @brief Unit tests for content records and protocol serialization
 *
 * Tests message serialization including:
 * - ServerType conversion
 * - Record JSON serialization/deserialization
 * - Request and response wire format
 * - Edge cases and error handling
 */

#include <gtest/gtest.h>
#include "meshdir/codec.hpp"
#include "meshdir/message_types.hpp"
#include "meshdir/utilities.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace meshdir;
using json = nlohmann::json;

// Test fixture for message types tests
class MessageTypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ByteCodec::initialize());
    }

    const std::string id_text = "6f1c2a34-9b0e-4d7a-8c55-0123456789ab";
};

// ============================================================================
// ServerType Tests
// ============================================================================

TEST_F(MessageTypesTest, ServerTypeToString) {
    EXPECT_EQ(server_type_to_string(ServerType::TEXT_SERVER), "TextServer");
    EXPECT_EQ(server_type_to_string(ServerType::MEDIA_SERVER), "MediaServer");
}

TEST_F(MessageTypesTest, StringToServerType) {
    auto type = string_to_server_type("MediaServer");
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(*type, ServerType::MEDIA_SERVER);

    EXPECT_FALSE(string_to_server_type("textserver").has_value());
}

// ============================================================================
// Record Tests
// ============================================================================

TEST_F(MessageTypesTest, TextFileSummary) {
    TextFile file{*Uuid::parse(id_text), "Notes", "body"};
    EXPECT_EQ(file.summary(), id_text + ":Notes");
}

TEST_F(MessageTypesTest, TextFileJsonFields) {
    TextFile file{*Uuid::parse(id_text), "Notes", "line one\nline two"};

    auto encoded = file.to_json();
    ASSERT_TRUE(encoded.has_value());

    json j = json::parse(*encoded);
    EXPECT_EQ(j["id"], id_text);
    EXPECT_EQ(j["title"], "Notes");
    EXPECT_EQ(j["content"], "line one\nline two");

    auto decoded = TextFile::from_json(*encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, file.id);
    EXPECT_EQ(decoded->content, file.content);
}

TEST_F(MessageTypesTest, TextFileInvalidUtf8NotSerializable) {
    TextFile file{Uuid::generate_v4(), std::string("bad \xff title"), "body"};
    EXPECT_FALSE(file.to_json().has_value());
}

TEST_F(MessageTypesTest, TextFileRejectsBadId) {
    EXPECT_FALSE(TextFile::from_json(R"({"id":"nope","title":"t","content":"c"})").has_value());
    EXPECT_FALSE(TextFile::from_json(R"({"title":"t","content":"c"})").has_value());
    EXPECT_FALSE(TextFile::from_json("not json").has_value());
}

TEST_F(MessageTypesTest, MediaFileDataIsBase64) {
    MediaFile file{*Uuid::parse(id_text), "Logo", "image/png", {0x00, 0xFF, 0x10}};

    auto encoded = file.to_json();
    ASSERT_TRUE(encoded.has_value());

    json j = json::parse(*encoded);
    EXPECT_EQ(j["data"], "AP8Q");
    EXPECT_EQ(j["mime_type"], "image/png");

    auto decoded = MediaFile::from_json(*encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->data, file.data);
}

TEST_F(MessageTypesTest, ListFromJsonSkipsInvalidEntries) {
    std::string doc = R"([
        {"id":"6f1c2a34-9b0e-4d7a-8c55-0123456789ab","title":"a","content":"x"},
        {"id":"broken","title":"b","content":"y"},
        42,
        {"id":"00000000-0000-4000-8000-000000000001","title":"c","content":"z"}
    ])";

    size_t skipped = 0;
    auto records = TextFile::list_from_json(doc, &skipped);

    EXPECT_EQ(records.size(), 2);
    EXPECT_EQ(skipped, 2);
}

TEST_F(MessageTypesTest, ListFromJsonRequiresArray) {
    size_t skipped = 7;
    EXPECT_TRUE(TextFile::list_from_json(R"({"id":"x"})", &skipped).empty());
    EXPECT_EQ(skipped, 0);
}

// ============================================================================
// Request Tests
// ============================================================================

TEST_F(MessageTypesTest, EncodeRequestTags) {
    json j = json::parse(ProtocolCodec::encode_request(request::ServerTypeQuery{}));
    EXPECT_EQ(j["type"], "ServerTypeQuery");

    j = json::parse(ProtocolCodec::encode_request(request::FileQuery{id_text}));
    EXPECT_EQ(j["type"], "FileQuery");
    EXPECT_EQ(j["file_id"], id_text);

    j = json::parse(ProtocolCodec::encode_request(request::MediaQuery{"m"}));
    EXPECT_EQ(j["media_id"], "m");
}

TEST_F(MessageTypesTest, DecodeRequest) {
    auto request = ProtocolCodec::decode_request(R"({"type":"FileQuery","file_id":"abc"})");
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(std::holds_alternative<request::FileQuery>(*request));
    EXPECT_EQ(std::get<request::FileQuery>(*request).file_id, "abc");

    auto list = ProtocolCodec::decode_request(R"({"type":"TextFilesListQuery"})");
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(std::holds_alternative<request::TextFilesListQuery>(*list));
}

TEST_F(MessageTypesTest, DecodeRequestInvalid) {
    EXPECT_FALSE(ProtocolCodec::decode_request("").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_request("{}").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_request(R"({"type":"Unknown"})").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_request(R"({"type":"FileQuery"})").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_request(R"({"type":"FileQuery","file_id":5})").has_value());
}

TEST_F(MessageTypesTest, RequestNames) {
    EXPECT_EQ(ProtocolCodec::request_name(request::MediaFilesListQuery{}), "MediaFilesListQuery");
    EXPECT_EQ(ProtocolCodec::request_name(request::MediaQuery{}), "MediaQuery");
}

// ============================================================================
// Response Tests
// ============================================================================

TEST_F(MessageTypesTest, EncodeItemUsesBase64) {
    auto encoded = ProtocolCodec::encode_response(response::Item{utilities::string_to_bytes("hi")});
    ASSERT_TRUE(encoded.has_value());

    json j = json::parse(*encoded);
    EXPECT_EQ(j["type"], "Item");
    EXPECT_EQ(j["file_data"], "aGk=");
}

TEST_F(MessageTypesTest, EncodeErrorResponses) {
    json j = json::parse(*ProtocolCodec::encode_response(response::ErrorNotFound{"abc"}));
    EXPECT_EQ(j["type"], "ErrorNotFound");
    EXPECT_EQ(j["id"], "abc");

    j = json::parse(*ProtocolCodec::encode_response(
        response::ErrorUnsupportedRequest{"MediaQuery", ServerType::TEXT_SERVER}));
    EXPECT_EQ(j["type"], "ErrorUnsupportedRequest");
    EXPECT_EQ(j["request"], "MediaQuery");
    EXPECT_EQ(j["server_type"], "TextServer");

    j = json::parse(*ProtocolCodec::encode_response(response::ServerTypeResponse{ServerType::MEDIA_SERVER}));
    EXPECT_EQ(j["type"], "ServerType");
    EXPECT_EQ(j["server_type"], "MediaServer");
}

TEST_F(MessageTypesTest, EncodeResponseInvalidUtf8Fails) {
    auto encoded = ProtocolCodec::encode_response(response::ItemList{{std::string("x:\xc3")}});
    EXPECT_FALSE(encoded.has_value());
}

TEST_F(MessageTypesTest, DecodeResponses) {
    auto list = ProtocolCodec::decode_response(R"({"type":"ItemList","items":["a:1","b:2"]})");
    ASSERT_TRUE(list.has_value());
    ASSERT_TRUE(std::holds_alternative<response::ItemList>(*list));
    EXPECT_EQ(std::get<response::ItemList>(*list).items.size(), 2);

    auto item = ProtocolCodec::decode_response(R"({"type":"Item","file_data":"aGk="})");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(utilities::bytes_to_string(std::get<response::Item>(*item).file_data), "hi");

    auto invalid = ProtocolCodec::decode_response(R"({"type":"ErrorInvalidId","id":"zz"})");
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ(std::get<response::ErrorInvalidId>(*invalid).id, "zz");
}

TEST_F(MessageTypesTest, DecodeResponseInvalid) {
    EXPECT_FALSE(ProtocolCodec::decode_response(R"({"type":"ServerType","server_type":"Other"})").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_response(R"({"type":"Item","file_data":"@@@"})").has_value());
    EXPECT_FALSE(ProtocolCodec::decode_response("[1,2]").has_value());
}
