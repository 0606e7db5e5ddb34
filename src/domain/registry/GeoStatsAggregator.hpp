/**
 * @file GeoStatsAggregator.hpp
 * @brief Per-region counters maintained as a side effect of record creation.
 */

#pragma once

#include <optional>
#include <string>

#include "RegistryState.hpp"

namespace parasitereg::domain::registry {

/**
 * @class GeoStatsAggregator
 * @brief Only RecordStore calls increment(); there is no external write path.
 */
class GeoStatsAggregator {
public:
    explicit GeoStatsAggregator(RegistryState& state) : m_state(state) {}

    // Creates the region lazily on its first case.
    void increment(const std::string& region, std::uint64_t sequence) {
        auto it = m_state.geoStats.find(region);
        if (it == m_state.geoStats.end()) {
            it = m_state.geoStats.emplace(region, GeoStat{region, 0, 0}).first;
        }
        it->second.totalCases += 1;
        it->second.lastUpdated = sequence;
    }

    std::optional<GeoStat> get(const std::string& region) const {
        auto it = m_state.geoStats.find(region);
        if (it == m_state.geoStats.end()) return std::nullopt;
        return it->second;
    }

private:
    RegistryState& m_state;
};

} // namespace parasitereg::domain::registry
