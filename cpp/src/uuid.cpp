/**
 * @file uuid.cpp
 * @brief Implementation of UUID parsing, formatting and generation
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/uuid.hpp"
#include "meshdir/codec.hpp"
#include "meshdir/utilities.hpp"

#include <algorithm>

namespace meshdir {

namespace {

constexpr size_t SIMPLE_LENGTH = 32;
constexpr size_t HYPHENATED_LENGTH = 36;
const std::string URN_PREFIX = "urn:uuid:";

// Hyphen positions in the 8-4-4-4-12 form
bool is_hyphen_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

std::optional<Uuid> parse_hyphenated(const std::string& text) {
    std::string simple;
    simple.reserve(SIMPLE_LENGTH);

    for (size_t i = 0; i < text.size(); ++i) {
        if (is_hyphen_position(i)) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            continue;
        }
        simple.push_back(text[i]);
    }

    auto bytes = ByteCodec::hex_to_bytes(simple);
    if (!bytes || bytes->size() != 16) {
        return std::nullopt;
    }

    Uuid::Bytes raw{};
    std::copy(bytes->begin(), bytes->end(), raw.begin());
    return Uuid(raw);
}

} // namespace

Uuid::Uuid() : bytes_{} {}

Uuid::Uuid(const Bytes& bytes) : bytes_(bytes) {}

std::optional<Uuid> Uuid::parse(const std::string& text) {
    if (text.size() == SIMPLE_LENGTH) {
        if (text.find('-') != std::string::npos) {
            return std::nullopt;
        }
        auto bytes = ByteCodec::hex_to_bytes(text);
        if (!bytes || bytes->size() != 16) {
            return std::nullopt;
        }
        Bytes raw{};
        std::copy(bytes->begin(), bytes->end(), raw.begin());
        return Uuid(raw);
    }

    if (text.size() == HYPHENATED_LENGTH) {
        return parse_hyphenated(text);
    }

    if (text.size() == HYPHENATED_LENGTH + 2 && text.front() == '{' && text.back() == '}') {
        return parse_hyphenated(text.substr(1, HYPHENATED_LENGTH));
    }

    if (text.size() == URN_PREFIX.size() + HYPHENATED_LENGTH &&
        utilities::to_lowercase(text.substr(0, URN_PREFIX.size())) == URN_PREFIX) {
        return parse_hyphenated(text.substr(URN_PREFIX.size()));
    }

    return std::nullopt;
}

Uuid Uuid::generate_v4() {
    auto random = ByteCodec::generate_random_bytes(16);

    Bytes raw{};
    std::copy(random.begin(), random.end(), raw.begin());

    // Set version (4) and variant bits according to RFC 4122
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);

    return Uuid(raw);
}

std::string Uuid::to_string() const {
    std::string hex = ByteCodec::bytes_to_hex(std::vector<uint8_t>(bytes_.begin(), bytes_.end()));

    std::string result;
    result.reserve(HYPHENATED_LENGTH);
    result.append(hex, 0, 8).append("-");
    result.append(hex, 8, 4).append("-");
    result.append(hex, 12, 4).append("-");
    result.append(hex, 16, 4).append("-");
    result.append(hex, 20, 12);
    return result;
}

bool Uuid::is_nil() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

} // namespace meshdir
