/**
 * @file uuid.hpp
 * @brief RFC 4122 identifiers for content records
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace meshdir {

/**
 * @brief Uuid - 128-bit content identifier
 *
 * Parsing accepts the simple (32 hex digits), hyphenated (8-4-4-4-12),
 * braced ({...}) and URN (urn:uuid:...) forms, case-insensitively.
 * Formatting always produces the lowercase hyphenated form.
 */
class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    /// Nil UUID (all zeros)
    Uuid();

    explicit Uuid(const Bytes& bytes);

    /**
     * @brief Parse a textual UUID
     * @param text UUID text
     * @return Parsed UUID or std::nullopt if the text is not a UUID
     */
    static std::optional<Uuid> parse(const std::string& text);

    /**
     * @brief Generate a random version 4 UUID
     */
    static Uuid generate_v4();

    /// Lowercase hyphenated representation
    std::string to_string() const;

    const Bytes& bytes() const { return bytes_; }

    bool is_nil() const;

    /// Version nibble (4 for random UUIDs)
    int version() const { return bytes_[6] >> 4; }

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace meshdir

namespace std {

template <>
struct hash<meshdir::Uuid> {
    size_t operator()(const meshdir::Uuid& id) const noexcept {
        // FNV-1a over the raw bytes
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : id.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
