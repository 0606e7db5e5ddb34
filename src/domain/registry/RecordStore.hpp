/**
 * @file RecordStore.hpp
 * @brief Versioned, append-only ledger of parasite records.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "AccessControl.hpp"
#include "GeoStatsAggregator.hpp"
#include "RegistryError.hpp"
#include "RegistryState.hpp"
#include "SequenceClock.hpp"
#include "events/RegistryEvents.hpp"

namespace parasitereg::domain::registry {

/** @brief Caller-supplied fields of a new record version. */
struct RecordSubmission {
    std::string parasiteName;
    std::string classification;
    std::string location;
    MetadataDigest metadataHash;
};

/**
 * @class RecordStore
 * @brief Records are never edited in place: an update archives the current
 * version and appends its successor.
 *
 * Per lineage: Active(v1) -> Archived(v1) + Active(v2) -> ...
 * Only the newest version of a lineage is Active.
 */
class RecordStore {
public:
    RecordStore(RegistryState& state,
                const AccessControl& access,
                GeoStatsAggregator& geoStats,
                SequenceClock& clock,
                std::vector<RegistryEvent>& pending);

    /** @brief Creates version 1 of a new lineage. Caller must be a verified member. */
    Result<RecordId> addRecord(const RecordSubmission& submission, const Identity& caller);

    /**
     * @brief Supersedes an Active record with a new version.
     *
     * Caller must be the author of the existing record or the admin of the
     * caller's own institution. The successor counts as a new geographic event.
     */
    Result<RecordId> updateRecord(RecordId existingId, const RecordSubmission& submission, const Identity& caller);

    std::optional<ParasiteRecord> getRecord(RecordId id) const;

    /** @brief The record followed by all its ancestors, newest first. */
    Result<std::vector<ParasiteRecord>> getRecordHistory(RecordId id) const;

    std::uint64_t getTotalRecords() const { return m_state.lastRecordId; }

    void apply(const RecordCreated& e);
    void apply(const RecordArchived& e);

private:
    std::optional<RegistryError> validateSubmission(const RecordSubmission& submission) const;

    RegistryState& m_state;
    const AccessControl& m_access;
    GeoStatsAggregator& m_geoStats;
    SequenceClock& m_clock;
    std::vector<RegistryEvent>& m_pending;
};

} // namespace parasitereg::domain::registry
