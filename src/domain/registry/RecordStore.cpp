/**
 * @file RecordStore.cpp
 * @brief Implementation of RecordStore.
 */

#include "domain/registry/RecordStore.hpp"
#include "domain/registry/TextRules.hpp"

namespace parasitereg::domain::registry {

RecordStore::RecordStore(RegistryState& state,
                         const AccessControl& access,
                         GeoStatsAggregator& geoStats,
                         SequenceClock& clock,
                         std::vector<RegistryEvent>& pending)
    : m_state(state), m_access(access), m_geoStats(geoStats), m_clock(clock), m_pending(pending) {}

std::optional<RegistryError> RecordStore::validateSubmission(const RecordSubmission& submission) const {
    if (auto invalid = CheckTextField("parasite_name", submission.parasiteName, RecordFieldLimits::ParasiteName)) {
        return invalid;
    }
    if (auto invalid = CheckTextField("classification", submission.classification, RecordFieldLimits::Classification)) {
        return invalid;
    }
    return CheckTextField("location", submission.location, RecordFieldLimits::Location);
}

Result<RecordId> RecordStore::addRecord(const RecordSubmission& submission, const Identity& caller) {
    if (auto denied = m_access.authorize(AccessRule::VerifiedMember, caller)) {
        return Result<RecordId>::fail(*denied);
    }
    if (auto invalid = validateSubmission(submission)) {
        return Result<RecordId>::fail(*invalid);
    }

    ParasiteRecord record;
    record.id = m_state.lastRecordId + 1;
    record.parasiteName = submission.parasiteName;
    record.classification = submission.classification;
    record.location = submission.location;
    record.recordedAt = m_clock.advance();
    record.author = caller;
    record.metadataHash = submission.metadataHash;
    record.status = RecordStatus::Active;
    record.version = 1;
    record.previousVersion = std::nullopt;

    RecordCreated evt{record};
    apply(evt);
    m_pending.push_back(evt);
    return Result<RecordId>::ok(record.id);
}

Result<RecordId> RecordStore::updateRecord(RecordId existingId,
                                           const RecordSubmission& submission,
                                           const Identity& caller) {
    auto it = m_state.records.find(existingId);
    if (it == m_state.records.end()) {
        return Result<RecordId>::fail(ErrorKind::InvalidRecord,
                                      "Record not found: " + std::to_string(existingId));
    }
    const ParasiteRecord& existing = it->second;
    if (!existing.isActive()) {
        return Result<RecordId>::fail(ErrorKind::InvalidRecord,
                                      "Record " + std::to_string(existingId) + " is archived.");
    }
    AccessTarget target;
    target.record = &existing;
    if (auto denied = m_access.authorize(AccessRule::RecordAuthorOrInstitutionAdmin, caller, target)) {
        return Result<RecordId>::fail(*denied);
    }
    if (auto invalid = validateSubmission(submission)) {
        return Result<RecordId>::fail(*invalid);
    }

    const std::uint64_t sequence = m_clock.advance();

    ParasiteRecord successor;
    successor.id = m_state.lastRecordId + 1;
    successor.parasiteName = submission.parasiteName;
    successor.classification = submission.classification;
    successor.location = submission.location;
    successor.recordedAt = sequence;
    successor.author = caller;
    successor.metadataHash = submission.metadataHash;
    successor.status = RecordStatus::Active;
    successor.version = existing.version + 1;
    successor.previousVersion = existingId;

    RecordArchived archived{existingId, caller, sequence};
    RecordCreated created{successor};
    apply(archived);
    apply(created);
    m_pending.push_back(archived);
    m_pending.push_back(created);
    return Result<RecordId>::ok(successor.id);
}

std::optional<ParasiteRecord> RecordStore::getRecord(RecordId id) const {
    auto it = m_state.records.find(id);
    if (it == m_state.records.end()) return std::nullopt;
    return it->second;
}

Result<std::vector<ParasiteRecord>> RecordStore::getRecordHistory(RecordId id) const {
    auto it = m_state.records.find(id);
    if (it == m_state.records.end()) {
        return Result<std::vector<ParasiteRecord>>::fail(ErrorKind::InvalidRecord,
                                                         "Record not found: " + std::to_string(id));
    }

    std::vector<ParasiteRecord> chain;
    chain.reserve(static_cast<std::size_t>(it->second.version));
    chain.push_back(it->second);

    // Predecessor ids strictly decrease, so the walk terminates.
    std::optional<RecordId> next = it->second.previousVersion;
    while (next) {
        auto prev = m_state.records.find(*next);
        if (prev == m_state.records.end() || prev->first >= chain.back().id) {
            return Result<std::vector<ParasiteRecord>>::fail(ErrorKind::InvalidRecord,
                "Broken lineage below record " + std::to_string(chain.back().id));
        }
        chain.push_back(prev->second);
        next = prev->second.previousVersion;
    }
    return Result<std::vector<ParasiteRecord>>::ok(std::move(chain));
}

void RecordStore::apply(const RecordCreated& e) {
    m_state.records[e.record.id] = e.record;
    if (e.record.id > m_state.lastRecordId) {
        m_state.lastRecordId = e.record.id;
    }
    m_geoStats.increment(e.record.location, e.record.recordedAt);
}

void RecordStore::apply(const RecordArchived& e) {
    auto it = m_state.records.find(e.recordId);
    if (it != m_state.records.end()) {
        it->second.status = RecordStatus::Archived;
    }
}

} // namespace parasitereg::domain::registry
