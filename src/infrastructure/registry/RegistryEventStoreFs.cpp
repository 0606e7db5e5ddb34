/**
 * @file RegistryEventStoreFs.cpp
 * @brief Implementation of RegistryEventStoreFs.
 */

#include "infrastructure/registry/RegistryEventStoreFs.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace parasitereg::infrastructure::registry {

using json = nlohmann::json;
namespace fs = std::filesystem;

RegistryEventStoreFs::RegistryEventStoreFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_dataRoot(std::move(dataRoot)), m_persistence(std::move(persistence)) {}

std::string RegistryEventStoreFs::getEventsFilePath() const {
    // Structure: <root>/registry/events.ndjson
    return (fs::path(m_dataRoot) / "registry" / "events.ndjson").string();
}

bool RegistryEventStoreFs::exists() const {
    return fs::exists(getEventsFilePath());
}

void RegistryEventStoreFs::append(const std::vector<StoredEvent>& events) {
    if (events.empty()) return;

    std::stringstream newContent;
    for (const auto& evt : events) {
        json j;
        j["type"] = evt.eventType;
        j["seq"] = evt.sequence;
        j["data"] = json::parse(evt.eventDataJson);
        newContent << j.dump() << "\n";
    }

    m_persistence->appendTextAsync(getEventsFilePath(), newContent.str());
}

std::vector<StoredEvent> RegistryEventStoreFs::readAll() const {
    std::vector<StoredEvent> results;
    std::string filepath = getEventsFilePath();

    if (!fs::exists(filepath)) return results;

    std::ifstream inFile(filepath);
    if (!inFile) {
        throw std::runtime_error("Cannot open event log: " + filepath);
    }

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            StoredEvent evt;
            evt.eventType = j.at("type").get<std::string>();
            evt.eventDataJson = j.at("data").dump(); // Keep as string for later parsing
            evt.sequence = j.at("seq").get<std::uint64_t>();
            results.push_back(std::move(evt));
        } catch (const json::exception& e) {
            throw std::runtime_error("Malformed event at " + filepath + ":" + std::to_string(lineNo) +
                                     ": " + e.what());
        }
    }
    return results;
}

void RegistryEventStoreFs::flush() {
    if (!m_persistence->flush()) {
        throw std::runtime_error("Failed to persist events to " + getEventsFilePath());
    }
}

} // namespace parasitereg::infrastructure::registry
