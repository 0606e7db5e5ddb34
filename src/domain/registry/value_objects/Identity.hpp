/**
 * @file Identity.hpp
 * @brief Value Object for an authenticated caller.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace parasitereg::domain::registry {

/**
 * @class Identity
 * @brief Opaque principal derived from a public key.
 *
 * Only equality is meaningful; identities have no ordering.
 */
class Identity {
public:
    static constexpr std::size_t Size = 20;
    using Bytes = std::array<std::uint8_t, Size>;

    Identity() : m_bytes{} {}
    explicit Identity(const Bytes& bytes) : m_bytes(bytes) {}

    /** @brief Parses a 40-character hex string. Returns nullopt on any other input. */
    static std::optional<Identity> fromHex(const std::string& hex);

    std::string toHex() const;
    const Bytes& bytes() const { return m_bytes; }

    bool operator==(const Identity& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Identity& other) const { return !(*this == other); }

private:
    Bytes m_bytes;
};

struct IdentityHash {
    std::size_t operator()(const Identity& id) const noexcept;
};

} // namespace parasitereg::domain::registry
