/**
 * @file codec.hpp
 * @brief Binary encodings and secure randomness for MeshDir
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Binary fields travel inside JSON documents as base64 strings. Session ids
 * and content identifiers are drawn from libsodium's CSPRNG.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshdir {

/**
 * @brief ByteCodec - stateless encoding helpers backed by libsodium
 */
class ByteCodec {
public:
    /**
     * @brief Initialize libsodium (safe to call multiple times)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of random bytes to generate
     * @return Vector of random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Generate a uniformly random 64-bit value
     */
    static uint64_t random_u64();

    /**
     * @brief Convert bytes to lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @param hex Hexadecimal string (upper or lower case)
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Convert bytes to base64 string (original alphabet, padded)
     */
    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert base64 string to bytes
     * @param base64 Base64 string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);
};

} // namespace meshdir
