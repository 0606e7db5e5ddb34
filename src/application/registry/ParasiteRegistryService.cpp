/**
 * @file ParasiteRegistryService.cpp
 * @brief Implementation of ParasiteRegistryService.
 */

#include "application/registry/ParasiteRegistryService.hpp"
#include "application/registry/RegistryAuditor.hpp"

#include <iostream>
#include <stdexcept>

namespace parasitereg::application::registry {

ParasiteRegistryService::ParasiteRegistryService(const Identity& owner,
                                                 std::shared_ptr<IRegistryRepository> repository,
                                                 std::shared_ptr<SequenceClock> clock,
                                                 bool verbose)
    : m_repository(std::move(repository)), m_clock(std::move(clock)), m_verbose(verbose) {
    m_registry = m_repository->load(*m_clock);
    if (!m_registry) {
        m_registry = std::make_unique<ParasiteRegistry>(owner, *m_clock);
        m_repository->save(*m_registry);
        m_repository->flush();
        if (m_verbose) {
            std::clog << "[ParasiteRegistryService] Created registry owned by " << owner.toHex() << std::endl;
        }
        return;
    }

    if (m_registry->getOwner() != owner) {
        std::cerr << "[ParasiteRegistryService] Stored registry belongs to "
                  << m_registry->getOwner().toHex() << ", not " << owner.toHex() << std::endl;
        throw std::runtime_error("Registry owner mismatch.");
    }
    if (m_verbose) {
        std::clog << "[ParasiteRegistryService] Loaded registry with "
                  << m_registry->getTotalRecords() << " records." << std::endl;
    }
}

template <typename T>
Result<T> ParasiteRegistryService::commit(const RegistryState& before, Result<T> result, const std::string& operation) {
    if (!result.isOk()) {
        // A rejected command emits nothing, but never leave stray events behind.
        m_registry->clearUncommittedEvents();
        if (m_verbose) {
            std::cerr << "[ParasiteRegistryService] " << operation << " rejected ("
                      << ErrorKindToString(result.kind()) << "): " << result.error().message << std::endl;
        }
        return result;
    }

    const std::size_t eventCount = m_registry->getUncommittedEvents().size();
    if (eventCount == 0) return result;

    // The write is acknowledged only once its events are on disk.
    try {
        m_repository->update(*m_registry);
        m_repository->flush();
    } catch (const std::exception& e) {
        m_registry->rollbackTo(before);
        std::cerr << "[ParasiteRegistryService] " << operation << " rolled back, events not persisted: "
                  << e.what() << std::endl;
        throw std::runtime_error(operation + " could not be persisted: " + e.what());
    }

    if (m_verbose) {
        std::clog << "[ParasiteRegistryService] " << operation << " committed "
                  << eventCount << " event(s)." << std::endl;
    }
    return result;
}

Result<RecordId> ParasiteRegistryService::addParasiteRecord(const std::string& parasiteName,
                                                            const std::string& classification,
                                                            const std::string& location,
                                                            const MetadataDigest& metadataHash,
                                                            const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->addParasiteRecord(parasiteName, classification, location, metadataHash, caller),
                  "add_parasite_record");
}

Result<RecordId> ParasiteRegistryService::updateParasiteRecord(RecordId existingId,
                                                               const std::string& parasiteName,
                                                               const std::string& classification,
                                                               const std::string& location,
                                                               const MetadataDigest& metadataHash,
                                                               const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->updateParasiteRecord(existingId, parasiteName, classification, location,
                                                   metadataHash, caller),
                  "update_parasite_record");
}

Result<Unit> ParasiteRegistryService::registerInstitution(const InstitutionId& id,
                                                          const std::string& name,
                                                          const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->registerInstitution(id, name, caller), "register_institution");
}

Result<Unit> ParasiteRegistryService::verifyInstitution(const InstitutionId& id, const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->verifyInstitution(id, caller), "verify_institution");
}

Result<Unit> ParasiteRegistryService::transferInstitutionAdmin(const InstitutionId& id,
                                                               const Identity& newAdmin,
                                                               const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->transferInstitutionAdmin(id, newAdmin, caller), "transfer_institution_admin");
}

Result<Unit> ParasiteRegistryService::setResearcherMembership(const Identity& researcher,
                                                              const InstitutionId& institutionId,
                                                              const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->setResearcherMembership(researcher, institutionId, caller),
                  "set_researcher_membership");
}

Result<Unit> ParasiteRegistryService::revokeResearcherMembership(const Identity& researcher,
                                                                 const Identity& caller) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryState before = m_registry->state();
    return commit(before, m_registry->revokeResearcherMembership(researcher, caller), "revoke_researcher_membership");
}

std::optional<ParasiteRecord> ParasiteRegistryService::getParasiteRecord(RecordId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getParasiteRecord(id);
}

Result<std::vector<ParasiteRecord>> ParasiteRegistryService::getParasiteRecordHistory(RecordId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getParasiteRecordHistory(id);
}

std::optional<GeoStat> ParasiteRegistryService::getGeographicStats(const std::string& region) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getGeographicStats(region);
}

std::optional<Institution> ParasiteRegistryService::getInstitutionDetails(const InstitutionId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getInstitutionDetails(id);
}

std::optional<InstitutionId> ParasiteRegistryService::getResearcherMembership(const Identity& researcher) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getResearcherMembership(researcher);
}

std::uint64_t ParasiteRegistryService::getTotalRecords() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getTotalRecords();
}

Identity ParasiteRegistryService::getRegistryOwner() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->getOwner();
}

nlohmann::json ParasiteRegistryService::auditRegistry() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    RegistryAuditor auditor;
    return auditor.Audit(m_registry->state());
}

RegistryState ParasiteRegistryService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registry->state();
}

void ParasiteRegistryService::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_repository->flush();
}

} // namespace parasitereg::application::registry
