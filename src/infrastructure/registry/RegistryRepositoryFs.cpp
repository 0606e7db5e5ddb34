/**
 * @file RegistryRepositoryFs.cpp
 * @brief Implementation of RegistryRepositoryFs.
 */

#include "infrastructure/registry/RegistryRepositoryFs.hpp"
#include "infrastructure/registry/RegistryJson.hpp"
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace parasitereg::infrastructure::registry {

using json = nlohmann::json;

RegistryRepositoryFs::RegistryRepositoryFs(std::unique_ptr<RegistryEventStoreFs> eventStore)
    : m_eventStore(std::move(eventStore)) {}

std::vector<StoredEvent> RegistryRepositoryFs::serializeEvents(const std::vector<RegistryEvent>& domainEvents) {
    std::vector<StoredEvent> stored;
    for (const auto& varEvent : domainEvents) {
        std::visit([&](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            json j;

            if constexpr (std::is_same_v<T, RegistryInitialized>) {
                j = {{"owner", e.owner.toHex()}};
            }
            else if constexpr (std::is_same_v<T, InstitutionRegistered>) {
                j = {
                    {"institutionId", e.institutionId},
                    {"name", e.name},
                    {"admin", e.admin.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, InstitutionVerified>) {
                j = {
                    {"institutionId", e.institutionId},
                    {"verifiedBy", e.verifiedBy.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, InstitutionAdminChanged>) {
                j = {
                    {"institutionId", e.institutionId},
                    {"newAdmin", e.newAdmin.toHex()},
                    {"changedBy", e.changedBy.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, MembershipAssigned>) {
                j = {
                    {"researcher", e.researcher.toHex()},
                    {"institutionId", e.institutionId},
                    {"assignedBy", e.assignedBy.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, MembershipRevoked>) {
                j = {
                    {"researcher", e.researcher.toHex()},
                    {"revokedBy", e.revokedBy.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, RecordArchived>) {
                j = {
                    {"recordId", e.recordId},
                    {"archivedBy", e.archivedBy.toHex()}
                };
            }
            else if constexpr (std::is_same_v<T, RecordCreated>) {
                j = {{"record", RecordToJson(e.record)}};
            }

            stored.push_back({T::Type, j.dump(), EventSequence(varEvent)});
        }, varEvent);
    }
    return stored;
}

RegistryEvent RegistryRepositoryFs::deserializeEvent(const StoredEvent& s) {
    auto j = json::parse(s.eventDataJson);

    if (s.eventType == RegistryInitialized::Type) {
        return RegistryInitialized{IdentityFromJson(j, "owner"), s.sequence};
    }
    if (s.eventType == InstitutionRegistered::Type) {
        return InstitutionRegistered{
            j.at("institutionId").get<std::string>(),
            j.at("name").get<std::string>(),
            IdentityFromJson(j, "admin"),
            s.sequence
        };
    }
    if (s.eventType == InstitutionVerified::Type) {
        return InstitutionVerified{
            j.at("institutionId").get<std::string>(),
            IdentityFromJson(j, "verifiedBy"),
            s.sequence
        };
    }
    if (s.eventType == InstitutionAdminChanged::Type) {
        return InstitutionAdminChanged{
            j.at("institutionId").get<std::string>(),
            IdentityFromJson(j, "newAdmin"),
            IdentityFromJson(j, "changedBy"),
            s.sequence
        };
    }
    if (s.eventType == MembershipAssigned::Type) {
        return MembershipAssigned{
            IdentityFromJson(j, "researcher"),
            j.at("institutionId").get<std::string>(),
            IdentityFromJson(j, "assignedBy"),
            s.sequence
        };
    }
    if (s.eventType == MembershipRevoked::Type) {
        return MembershipRevoked{
            IdentityFromJson(j, "researcher"),
            IdentityFromJson(j, "revokedBy"),
            s.sequence
        };
    }
    if (s.eventType == RecordArchived::Type) {
        return RecordArchived{
            j.at("recordId").get<RecordId>(),
            IdentityFromJson(j, "archivedBy"),
            s.sequence
        };
    }
    if (s.eventType == RecordCreated::Type) {
        RecordCreated evt{RecordFromJson(j.at("record"))};
        if (evt.record.recordedAt != s.sequence) {
            throw std::runtime_error("RecordCreated sequence mismatch for record " +
                                     std::to_string(evt.record.id));
        }
        return evt;
    }
    throw std::runtime_error("Unknown event type: " + s.eventType);
}

void RegistryRepositoryFs::save(ParasiteRegistry& registry) {
    if (m_eventStore->exists()) {
        throw std::runtime_error("Registry already exists at " + m_eventStore->getEventsFilePath());
    }
    update(registry);
}

void RegistryRepositoryFs::update(ParasiteRegistry& registry) {
    auto storedEvents = serializeEvents(registry.getUncommittedEvents());
    m_eventStore->append(storedEvents);
    registry.clearUncommittedEvents();
}

std::unique_ptr<ParasiteRegistry> RegistryRepositoryFs::load(SequenceClock& clock) {
    auto stored = m_eventStore->readAll();
    if (stored.empty()) return nullptr;

    std::vector<RegistryEvent> events;
    events.reserve(stored.size());
    try {
        for (const auto& s : stored) {
            events.push_back(deserializeEvent(s));
        }
    } catch (const std::exception& e) {
        std::cerr << "[RegistryRepositoryFs] Error rehydrating registry: " << e.what() << std::endl;
        throw std::runtime_error(std::string("Corrupted registry log: ") + e.what());
    }

    return ParasiteRegistry::rehydrate(events, clock);
}

void RegistryRepositoryFs::flush() {
    m_eventStore->flush();
}

} // namespace parasitereg::infrastructure::registry
