/**
 * @file ParasiteRegistry.hpp
 * @brief Aggregate Root owning every registry table and component.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "AccessControl.hpp"
#include "GeoStatsAggregator.hpp"
#include "InstitutionRegistry.hpp"
#include "RecordStore.hpp"
#include "RegistryError.hpp"
#include "RegistryState.hpp"
#include "ResearcherDirectory.hpp"
#include "SequenceClock.hpp"
#include "events/RegistryEvents.hpp"

namespace parasitereg::domain::registry {

/**
 * @class ParasiteRegistry
 * @brief One explicit registry instance: owner, tables and the components acting on them.
 *
 * Commands validate first and only then mutate, so a rejected command leaves the
 * state untouched. Every accepted change is recorded as an uncommitted event that
 * the repository persists. Not thread-safe; callers serialize access.
 */
class ParasiteRegistry {
    // Only rehydrate() can name this, so only it can build an empty instance.
    struct RehydrationTag {
        explicit RehydrationTag() = default;
    };

public:
    /** @brief Starts a new registry. Records a RegistryInitialized event. */
    ParasiteRegistry(const Identity& owner, SequenceClock& clock);

    /** @brief Empty instance for rehydrate(). */
    ParasiteRegistry(RehydrationTag, SequenceClock& clock);

    ParasiteRegistry(const ParasiteRegistry&) = delete;
    ParasiteRegistry& operator=(const ParasiteRegistry&) = delete;

    /**
     * @brief Rebuilds a registry from its committed events.
     * @throws std::runtime_error if the stream does not start with RegistryInitialized.
     */
    static std::unique_ptr<ParasiteRegistry> rehydrate(const std::vector<RegistryEvent>& events,
                                                       SequenceClock& clock);

    // --- Event Management ---
    const std::vector<RegistryEvent>& getUncommittedEvents() const { return m_pending; }
    void clearUncommittedEvents() { m_pending.clear(); }

    /** @brief Drops uncommitted events and puts every table back to `snapshot`. */
    void rollbackTo(const RegistryState& snapshot) {
        m_state = snapshot;
        m_pending.clear();
    }

    // --- Commands ---
    Result<RecordId> addParasiteRecord(const std::string& parasiteName,
                                       const std::string& classification,
                                       const std::string& location,
                                       const MetadataDigest& metadataHash,
                                       const Identity& caller);

    Result<RecordId> updateParasiteRecord(RecordId existingId,
                                          const std::string& parasiteName,
                                          const std::string& classification,
                                          const std::string& location,
                                          const MetadataDigest& metadataHash,
                                          const Identity& caller);

    Result<Unit> registerInstitution(const InstitutionId& id, const std::string& name, const Identity& caller);
    Result<Unit> verifyInstitution(const InstitutionId& id, const Identity& caller);
    Result<Unit> transferInstitutionAdmin(const InstitutionId& id, const Identity& newAdmin, const Identity& caller);
    Result<Unit> setResearcherMembership(const Identity& researcher, const InstitutionId& institutionId,
                                         const Identity& caller);
    Result<Unit> revokeResearcherMembership(const Identity& researcher, const Identity& caller);

    // --- Queries ---
    std::optional<ParasiteRecord> getParasiteRecord(RecordId id) const;
    Result<std::vector<ParasiteRecord>> getParasiteRecordHistory(RecordId id) const;
    std::optional<GeoStat> getGeographicStats(const std::string& region) const;
    std::optional<Institution> getInstitutionDetails(const InstitutionId& id) const;
    std::optional<InstitutionId> getResearcherMembership(const Identity& researcher) const;
    std::uint64_t getTotalRecords() const;
    const Identity& getOwner() const { return m_state.owner; }

    /** @brief Read-only view of every table, used for snapshots and audits. */
    const RegistryState& state() const { return m_state; }

    // --- Rehydration (Apply Events) ---
    void applyEvent(const RegistryEvent& event);

    void apply(const RegistryInitialized& e);
    void apply(const InstitutionRegistered& e) { m_institutions.apply(e); }
    void apply(const InstitutionVerified& e) { m_institutions.apply(e); }
    void apply(const InstitutionAdminChanged& e) { m_institutions.apply(e); }
    void apply(const MembershipAssigned& e) { m_directory.apply(e); }
    void apply(const MembershipRevoked& e) { m_directory.apply(e); }
    void apply(const RecordArchived& e) { m_records.apply(e); }
    void apply(const RecordCreated& e) { m_records.apply(e); }

private:
    RegistryState m_state;
    std::vector<RegistryEvent> m_pending;
    SequenceClock& m_clock;

    // Components keep references to the members above; declaration order matters.
    AccessControl m_access;
    GeoStatsAggregator m_geoStats;
    InstitutionRegistry m_institutions;
    ResearcherDirectory m_directory;
    RecordStore m_records;
};

} // namespace parasitereg::domain::registry
