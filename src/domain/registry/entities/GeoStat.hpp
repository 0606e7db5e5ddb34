/**
 * @file GeoStat.hpp
 * @brief Per-region running count of record-creation events.
 */

#pragma once

#include <cstdint>
#include <string>

namespace parasitereg::domain::registry {

struct GeoStat {
    std::string region;
    std::uint64_t totalCases = 0;
    std::uint64_t lastUpdated = 0;  ///< Sequence value of the latest create in the region.

    bool operator==(const GeoStat& other) const {
        return region == other.region && totalCases == other.totalCases &&
               lastUpdated == other.lastUpdated;
    }
    bool operator!=(const GeoStat& other) const { return !(*this == other); }
};

} // namespace parasitereg::domain::registry
