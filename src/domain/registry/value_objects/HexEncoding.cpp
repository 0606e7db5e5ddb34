/**
 * @file HexEncoding.cpp
 * @brief Implementation of the hex helpers and the value objects built on them.
 */

#include "domain/registry/value_objects/HexEncoding.hpp"
#include "domain/registry/value_objects/Identity.hpp"
#include "domain/registry/value_objects/MetadataDigest.hpp"

namespace parasitereg::domain::registry {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string EncodeHex(const std::uint8_t* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

bool DecodeHex(const std::string& hex, std::uint8_t* out, std::size_t size) {
    if (hex.size() != size * 2) return false;
    for (std::size_t i = 0; i < size; ++i) {
        int hi = HexValue(hex[2 * i]);
        int lo = HexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

std::optional<Identity> Identity::fromHex(const std::string& hex) {
    Bytes bytes{};
    if (!DecodeHex(hex, bytes.data(), bytes.size())) return std::nullopt;
    return Identity(bytes);
}

std::string Identity::toHex() const {
    return EncodeHex(m_bytes.data(), m_bytes.size());
}

std::size_t IdentityHash::operator()(const Identity& id) const noexcept {
    // FNV-1a over the raw bytes
    std::size_t h = 1469598103934665603ULL;
    for (auto b : id.bytes()) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return h;
}

std::optional<MetadataDigest> MetadataDigest::fromHex(const std::string& hex) {
    Bytes bytes{};
    if (!DecodeHex(hex, bytes.data(), bytes.size())) return std::nullopt;
    return MetadataDigest(bytes);
}

std::string MetadataDigest::toHex() const {
    return EncodeHex(m_bytes.data(), m_bytes.size());
}

} // namespace parasitereg::domain::registry
