/**
 * @file ParasiteRegistryService.hpp
 * @brief Application Service exposing the registry's public operation surface.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/registry/ParasiteRegistry.hpp"
#include "domain/registry/SequenceClock.hpp"
#include "domain/registry/repositories/IRegistryRepository.hpp"

namespace parasitereg::application::registry {

using namespace parasitereg::domain::registry;

/**
 * @class ParasiteRegistryService
 * @brief Serializes every operation on one ParasiteRegistry and commits its events.
 *
 * A write holds the lock from validation through persistence of its events,
 * so two updates of the same lineage can never both see the predecessor Active.
 */
class ParasiteRegistryService {
public:
    /**
     * @brief Opens the registry stored in `repository`, creating it if absent.
     * @throws std::runtime_error if the stored registry belongs to another owner.
     */
    ParasiteRegistryService(const Identity& owner,
                            std::shared_ptr<IRegistryRepository> repository,
                            std::shared_ptr<SequenceClock> clock,
                            bool verbose = true);

    // Writes. Each returns only after its events are durable.
    // @throws std::runtime_error on a persistence fault; the registry is left unchanged.
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

    // Reads
    std::optional<ParasiteRecord> getParasiteRecord(RecordId id) const;
    Result<std::vector<ParasiteRecord>> getParasiteRecordHistory(RecordId id) const;
    std::optional<GeoStat> getGeographicStats(const std::string& region) const;
    std::optional<Institution> getInstitutionDetails(const InstitutionId& id) const;
    std::optional<InstitutionId> getResearcherMembership(const Identity& researcher) const;
    std::uint64_t getTotalRecords() const;
    Identity getRegistryOwner() const;

    /** @brief Invariant report over the whole store (see RegistryAuditor). */
    nlohmann::json auditRegistry() const;

    /** @brief Copy of every table, taken under the lock. */
    RegistryState snapshot() const;

    /** @brief Waits until committed events are on disk. */
    void flush();

private:
    /**
     * @brief Persists the events of an accepted command, or discards those of a rejected one.
     * @throws std::runtime_error if persistence fails; the registry is first restored to `before`.
     */
    template <typename T>
    Result<T> commit(const RegistryState& before, Result<T> result, const std::string& operation);

    mutable std::mutex m_mutex;
    std::shared_ptr<IRegistryRepository> m_repository;
    std::shared_ptr<SequenceClock> m_clock;
    std::unique_ptr<ParasiteRegistry> m_registry;
    bool m_verbose;
};

} // namespace parasitereg::application::registry
