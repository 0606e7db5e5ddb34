/**
 * @file MetadataDigest.hpp
 * @brief Opaque 32-byte reference to off-chain record content.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace parasitereg::domain::registry {

/**
 * @class MetadataDigest
 * @brief Content reference produced by the external storage pipeline.
 *
 * The registry never interprets or dereferences it.
 */
class MetadataDigest {
public:
    static constexpr std::size_t Size = 32;
    using Bytes = std::array<std::uint8_t, Size>;

    MetadataDigest() : m_bytes{} {}
    explicit MetadataDigest(const Bytes& bytes) : m_bytes(bytes) {}

    /** @brief Parses a 64-character hex string. */
    static std::optional<MetadataDigest> fromHex(const std::string& hex);

    std::string toHex() const;
    const Bytes& bytes() const { return m_bytes; }

    bool operator==(const MetadataDigest& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const MetadataDigest& other) const { return !(*this == other); }

private:
    Bytes m_bytes;
};

} // namespace parasitereg::domain::registry
