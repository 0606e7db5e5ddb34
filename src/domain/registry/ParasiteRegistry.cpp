/**
 * @file ParasiteRegistry.cpp
 * @brief Implementation of the ParasiteRegistry aggregate.
 */

#include "domain/registry/ParasiteRegistry.hpp"

#include <stdexcept>

namespace parasitereg::domain::registry {

ParasiteRegistry::ParasiteRegistry(RehydrationTag, SequenceClock& clock)
    : m_clock(clock),
      m_access(m_state),
      m_geoStats(m_state),
      m_institutions(m_state, m_access, m_clock, m_pending),
      m_directory(m_state, m_access, m_clock, m_pending),
      m_records(m_state, m_access, m_geoStats, m_clock, m_pending) {}

ParasiteRegistry::ParasiteRegistry(const Identity& owner, SequenceClock& clock)
    : ParasiteRegistry(RehydrationTag{}, clock) {
    RegistryInitialized evt{owner, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
}

std::unique_ptr<ParasiteRegistry> ParasiteRegistry::rehydrate(const std::vector<RegistryEvent>& events,
                                                              SequenceClock& clock) {
    if (events.empty() || !std::holds_alternative<RegistryInitialized>(events.front())) {
        throw std::runtime_error("Registry event stream must start with RegistryInitialized.");
    }

    auto registry = std::make_unique<ParasiteRegistry>(RehydrationTag{}, clock);
    std::uint64_t lastSequence = 0;
    for (const auto& event : events) {
        const std::uint64_t sequence = EventSequence(event);
        if (sequence < lastSequence) {
            throw std::runtime_error("Registry event stream is out of sequence at " + std::to_string(sequence));
        }
        lastSequence = sequence;
        registry->applyEvent(event);
    }
    clock.observe(lastSequence);
    return registry;
}

void ParasiteRegistry::applyEvent(const RegistryEvent& event) {
    std::visit([this](auto&& arg) {
        this->apply(arg);
    }, event);
}

void ParasiteRegistry::apply(const RegistryInitialized& e) {
    m_state.owner = e.owner;
}

Result<RecordId> ParasiteRegistry::addParasiteRecord(const std::string& parasiteName,
                                                     const std::string& classification,
                                                     const std::string& location,
                                                     const MetadataDigest& metadataHash,
                                                     const Identity& caller) {
    return m_records.addRecord(RecordSubmission{parasiteName, classification, location, metadataHash}, caller);
}

Result<RecordId> ParasiteRegistry::updateParasiteRecord(RecordId existingId,
                                                        const std::string& parasiteName,
                                                        const std::string& classification,
                                                        const std::string& location,
                                                        const MetadataDigest& metadataHash,
                                                        const Identity& caller) {
    return m_records.updateRecord(existingId,
                                  RecordSubmission{parasiteName, classification, location, metadataHash},
                                  caller);
}

Result<Unit> ParasiteRegistry::registerInstitution(const InstitutionId& id,
                                                   const std::string& name,
                                                   const Identity& caller) {
    return m_institutions.registerInstitution(id, name, caller);
}

Result<Unit> ParasiteRegistry::verifyInstitution(const InstitutionId& id, const Identity& caller) {
    return m_institutions.verifyInstitution(id, caller);
}

Result<Unit> ParasiteRegistry::transferInstitutionAdmin(const InstitutionId& id,
                                                        const Identity& newAdmin,
                                                        const Identity& caller) {
    return m_institutions.transferAdmin(id, newAdmin, caller);
}

Result<Unit> ParasiteRegistry::setResearcherMembership(const Identity& researcher,
                                                       const InstitutionId& institutionId,
                                                       const Identity& caller) {
    return m_directory.setMembership(researcher, institutionId, caller);
}

Result<Unit> ParasiteRegistry::revokeResearcherMembership(const Identity& researcher, const Identity& caller) {
    return m_directory.revokeMembership(researcher, caller);
}

std::optional<ParasiteRecord> ParasiteRegistry::getParasiteRecord(RecordId id) const {
    return m_records.getRecord(id);
}

Result<std::vector<ParasiteRecord>> ParasiteRegistry::getParasiteRecordHistory(RecordId id) const {
    return m_records.getRecordHistory(id);
}

std::optional<GeoStat> ParasiteRegistry::getGeographicStats(const std::string& region) const {
    return m_geoStats.get(region);
}

std::optional<Institution> ParasiteRegistry::getInstitutionDetails(const InstitutionId& id) const {
    return m_institutions.getInstitution(id);
}

std::optional<InstitutionId> ParasiteRegistry::getResearcherMembership(const Identity& researcher) const {
    return m_directory.membershipOf(researcher);
}

std::uint64_t ParasiteRegistry::getTotalRecords() const {
    return m_records.getTotalRecords();
}

} // namespace parasitereg::domain::registry
