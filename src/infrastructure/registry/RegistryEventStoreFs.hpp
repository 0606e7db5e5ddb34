/**
 * @file RegistryEventStoreFs.hpp
 * @brief File-system based Event Store for the registry.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "infrastructure/PersistenceService.hpp"

namespace parasitereg::infrastructure::registry {

struct StoredEvent {
    std::string eventType;
    std::string eventDataJson; // The payload
    std::uint64_t sequence = 0;
};

/**
 * @class RegistryEventStoreFs
 * @brief Append-only NDJSON log at <root>/registry/events.ndjson.
 */
class RegistryEventStoreFs {
public:
    RegistryEventStoreFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    // Appends new events to the log
    void append(const std::vector<StoredEvent>& events);

    /**
     * @brief Reads all events in log order.
     * @throws std::runtime_error on a malformed line; the log is never read partially.
     */
    std::vector<StoredEvent> readAll() const;

    bool exists() const;

    /** @throws std::runtime_error if a queued write failed. */
    void flush();

    std::string getEventsFilePath() const;

private:
    std::string m_dataRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace parasitereg::infrastructure::registry
