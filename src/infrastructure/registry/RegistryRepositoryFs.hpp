/**
 * @file RegistryRepositoryFs.hpp
 * @brief File system implementation of the registry repository.
 */

#pragma once

#include <memory>
#include <vector>

#include "domain/registry/repositories/IRegistryRepository.hpp"
#include "RegistryEventStoreFs.hpp"

namespace parasitereg::infrastructure::registry {

using namespace parasitereg::domain::registry;

class RegistryRepositoryFs : public IRegistryRepository {
public:
    explicit RegistryRepositoryFs(std::unique_ptr<RegistryEventStoreFs> eventStore);

    void save(ParasiteRegistry& registry) override;
    std::unique_ptr<ParasiteRegistry> load(SequenceClock& clock) override;
    void update(ParasiteRegistry& registry) override;
    void flush() override;

    // Exposed for the round-trip tests
    static std::vector<StoredEvent> serializeEvents(const std::vector<RegistryEvent>& domainEvents);
    static RegistryEvent deserializeEvent(const StoredEvent& stored);

private:
    std::unique_ptr<RegistryEventStoreFs> m_eventStore;
};

} // namespace parasitereg::infrastructure::registry
