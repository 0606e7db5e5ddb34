/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving registry configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file out of the rest of the codebase.
 */

#pragma once

#include <string>

#include "domain/registry/value_objects/Identity.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace parasitereg::infrastructure {

struct RegistryConfig {
    domain::registry::Identity owner;       ///< Fixed for the lifetime of the registry.
    std::string dataRoot = "registry_data"; ///< Directory holding the event log.
    std::string httpHost = "127.0.0.1";
    int httpPort = 8080;
    bool verbose = true;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param configPath Path to the settings file.
     * @throws std::runtime_error if the file is missing, malformed or has no valid owner.
     */
    static RegistryConfig Load(const std::string& configPath);

    /**
     * @brief Writes the configuration atomically through the persistence worker.
     * @throws std::runtime_error if the file cannot be written.
     */
    static void Save(const std::string& configPath, const RegistryConfig& config, PersistenceService& persistence);
};

} // namespace parasitereg::infrastructure
