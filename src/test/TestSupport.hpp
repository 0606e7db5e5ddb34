/**
 * @file TestSupport.hpp
 * @brief Fixtures shared by the registry test executables.
 */

#pragma once

#include <cstdint>

#include "domain/registry/value_objects/Identity.hpp"
#include "domain/registry/value_objects/MetadataDigest.hpp"

namespace parasitereg::test {

inline domain::registry::Identity MakeIdentity(std::uint8_t seed) {
    domain::registry::Identity::Bytes bytes{};
    bytes.fill(seed);
    return domain::registry::Identity(bytes);
}

inline domain::registry::MetadataDigest MakeDigest(std::uint8_t seed) {
    domain::registry::MetadataDigest::Bytes bytes{};
    bytes.fill(seed);
    return domain::registry::MetadataDigest(bytes);
}

} // namespace parasitereg::test
