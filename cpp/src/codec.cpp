/**
 * @file codec.cpp
 * @brief Implementation of binary encodings using libsodium
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/codec.hpp"

#include <sodium.h>
#include <stdexcept>

namespace meshdir {

namespace {

void ensure_initialized() {
    if (!ByteCodec::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

} // namespace

bool ByteCodec::initialize() {
    // sodium_init returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Randomness
// ============================================================================

std::vector<uint8_t> ByteCodec::generate_random_bytes(size_t size) {
    ensure_initialized();
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), size);
    }
    return bytes;
}

uint64_t ByteCodec::random_u64() {
    ensure_initialized();
    uint64_t value = 0;
    randombytes_buf(&value, sizeof(value));
    return value;
}

// ============================================================================
// Hex
// ============================================================================

std::string ByteCodec::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::vector<char> hex(bytes.size() * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    return std::string(hex.data());
}

std::optional<std::vector<uint8_t>> ByteCodec::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,
        &decoded_len,
        &end_ptr
    );

    // Reject trailing characters that are not hex digits
    if (result != 0 || end_ptr != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

// ============================================================================
// Base64
// ============================================================================

std::string ByteCodec::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> ByteCodec::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);

    return bytes;
}

} // namespace meshdir
