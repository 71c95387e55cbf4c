/**
 * @file test_codec.cpp
 * @brief Unit tests for ByteCodec and Uuid
 *
 * Tests encoding and identifier handling including:
 * - Random byte and session id generation
 * - Hex and base64 encoding
 * - UUID parsing in every accepted form
 * - UUID generation and formatting
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "meshdir/codec.hpp"
#include "meshdir/uuid.hpp"
#include <set>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace meshdir;

// Test fixture for codec tests
class CodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ByteCodec::initialize());
    }

    const std::string canonical = "123e4567-e89b-42d3-a456-426614174000";
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(CodecTest, InitializeIsIdempotent) {
    EXPECT_TRUE(ByteCodec::initialize());
    EXPECT_TRUE(ByteCodec::initialize());
}

// ============================================================================
// Random Generation Tests
// ============================================================================

TEST_F(CodecTest, GenerateRandomBytesSize) {
    size_t sizes[] = {0, 1, 16, 64, 1024};

    for (size_t size : sizes) {
        EXPECT_EQ(ByteCodec::generate_random_bytes(size).size(), size);
    }
}

TEST_F(CodecTest, RandomSessionIdsDiffer) {
    std::set<uint64_t> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(ByteCodec::random_u64());
    }
    EXPECT_EQ(ids.size(), 100);
}

// ============================================================================
// Encoding Tests (Hex, Base64)
// ============================================================================

TEST_F(CodecTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
    EXPECT_EQ(ByteCodec::bytes_to_hex(bytes), "0123456789abcdef");
}

TEST_F(CodecTest, HexToBytes) {
    auto bytes = ByteCodec::hex_to_bytes("0123456789ABCDEF");

    ASSERT_TRUE(bytes.has_value());
    std::vector<uint8_t> expected = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
    EXPECT_EQ(*bytes, expected);
}

TEST_F(CodecTest, HexInvalidCharacters) {
    EXPECT_FALSE(ByteCodec::hex_to_bytes("0123456789GGGGGG").has_value());
}

TEST_F(CodecTest, HexOddLength) {
    EXPECT_FALSE(ByteCodec::hex_to_bytes("012345f").has_value());
}

TEST_F(CodecTest, Base64KnownValues) {
    EXPECT_EQ(ByteCodec::bytes_to_base64({'f', 'o', 'o'}), "Zm9v");
    EXPECT_EQ(ByteCodec::bytes_to_base64({'f', 'o'}), "Zm8=");

    auto decoded = ByteCodec::base64_to_bytes("Zm8=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (std::vector<uint8_t>{'f', 'o'}));
}

TEST_F(CodecTest, Base64EmptyInput) {
    std::string base64 = ByteCodec::bytes_to_base64({});
    EXPECT_TRUE(base64.empty());

    auto decoded = ByteCodec::base64_to_bytes(base64);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST_F(CodecTest, Base64RejectsGarbage) {
    EXPECT_FALSE(ByteCodec::base64_to_bytes("Zm9v!").has_value());
    EXPECT_FALSE(ByteCodec::base64_to_bytes("Zm9").has_value());
}

// ============================================================================
// Uuid Parsing Tests
// ============================================================================

TEST_F(CodecTest, UuidParseHyphenated) {
    auto id = Uuid::parse(canonical);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->to_string(), canonical);
    EXPECT_EQ(id->version(), 4);
}

TEST_F(CodecTest, UuidParseAlternateForms) {
    auto expected = Uuid::parse(canonical);
    ASSERT_TRUE(expected.has_value());

    const char* forms[] = {
        "123e4567e89b42d3a456426614174000",
        "{123e4567-e89b-42d3-a456-426614174000}",
        "urn:uuid:123e4567-e89b-42d3-a456-426614174000",
        "123E4567-E89B-42D3-A456-426614174000",
    };

    for (const char* form : forms) {
        auto parsed = Uuid::parse(form);
        ASSERT_TRUE(parsed.has_value()) << form;
        EXPECT_EQ(*parsed, *expected) << form;
    }
}

TEST_F(CodecTest, UuidParseRejectsMalformed) {
    const char* bad[] = {
        "",
        "not-a-uuid",
        "123e4567-e89b-42d3-a456-42661417400",
        "123e4567-e89b-42d3-a456-4266141740000",
        "123e4567+e89b-42d3-a456-426614174000",
        "123e4567-e89b-42d3-a456-42661417400g",
        "{123e4567-e89b-42d3-a456-426614174000",
        "12-e4567e89b42d3a456426614174000",
    };

    for (const char* text : bad) {
        EXPECT_FALSE(Uuid::parse(text).has_value()) << text;
    }
}

// ============================================================================
// Uuid Generation Tests
// ============================================================================

TEST_F(CodecTest, UuidNilByDefault) {
    Uuid id;
    EXPECT_TRUE(id.is_nil());
    EXPECT_EQ(id.to_string(), "00000000-0000-0000-0000-000000000000");
}

TEST_F(CodecTest, GenerateV4SetsVersionAndVariant) {
    Uuid id = Uuid::generate_v4();

    EXPECT_FALSE(id.is_nil());
    EXPECT_EQ(id.version(), 4);
    EXPECT_EQ(id.bytes()[8] & 0xC0, 0x80);

    auto reparsed = Uuid::parse(id.to_string());
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(*reparsed, id);
}

TEST_F(CodecTest, UuidOrderingAndHashing) {
    auto a = *Uuid::parse("00000000-0000-4000-8000-000000000001");
    auto b = *Uuid::parse("00000000-0000-4000-8000-000000000002");

    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    std::unordered_set<Uuid> set = {a, b, a};
    EXPECT_EQ(set.size(), 2);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(CodecTest, ConcurrentUuidGeneration) {
    const int num_threads = 4;
    const int per_thread = 250;
    std::vector<std::vector<Uuid>> results(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&results, t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                results[t].push_back(Uuid::generate_v4());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::unordered_set<Uuid> unique;
    for (const auto& batch : results) {
        unique.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(num_threads * per_thread));
}
