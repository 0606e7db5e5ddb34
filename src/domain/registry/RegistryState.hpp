/**
 * @file RegistryState.hpp
 * @brief The persisted tables of the registry, owned by one ParasiteRegistry.
 */

#pragma once

#include <map>
#include <string>
#include <unordered_map>

#include "entities/GeoStat.hpp"
#include "entities/Institution.hpp"
#include "entities/ParasiteRecord.hpp"
#include "value_objects/Identity.hpp"

namespace parasitereg::domain::registry {

/**
 * @struct RegistryState
 * @brief Plain value holding every table. Comparable for full-state snapshots.
 */
struct RegistryState {
    Identity owner;

    // Append-only, id-indexed. Only the status field of an entry ever changes.
    std::map<RecordId, ParasiteRecord> records;

    std::map<InstitutionId, Institution> institutions;

    // researcher -> institution
    std::unordered_map<Identity, InstitutionId, IdentityHash> memberships;

    // Derived from record creation, never decremented.
    std::map<std::string, GeoStat> geoStats;

    // Allocation counter: id of the last record created.
    RecordId lastRecordId = 0;

    bool operator==(const RegistryState& other) const {
        return owner == other.owner &&
               records == other.records &&
               institutions == other.institutions &&
               memberships == other.memberships &&
               geoStats == other.geoStats &&
               lastRecordId == other.lastRecordId;
    }
    bool operator!=(const RegistryState& other) const { return !(*this == other); }
};

} // namespace parasitereg::domain::registry
