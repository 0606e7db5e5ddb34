/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace parasitereg::infrastructure {

RegistryConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] Settings file not found: " << configPath << std::endl;
        throw std::runtime_error("Settings file not found: " + configPath);
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        throw std::runtime_error("Malformed settings file: " + configPath);
    }

    RegistryConfig config;
    if (!j.contains("owner") || !j["owner"].is_string()) {
        std::cerr << "[ConfigLoader] Missing 'owner' in " << configPath << std::endl;
        throw std::runtime_error("Settings file has no owner identity.");
    }
    auto owner = domain::registry::Identity::fromHex(j["owner"].get<std::string>());
    if (!owner) {
        std::cerr << "[ConfigLoader] 'owner' is not a 40-char hex identity." << std::endl;
        throw std::runtime_error("Settings file has an invalid owner identity.");
    }
    config.owner = *owner;

    try {
        config.dataRoot = j.value("data_root", config.dataRoot);
        config.httpHost = j.value("http_host", config.httpHost);
        config.httpPort = j.value("http_port", config.httpPort);
        config.verbose = j.value("verbose", config.verbose);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid value type: " << e.what() << std::endl;
        throw std::runtime_error("Settings file has an invalid value: " + std::string(e.what()));
    }
    return config;
}

void ConfigLoader::Save(const std::string& configPath,
                        const RegistryConfig& config,
                        PersistenceService& persistence) {
    nlohmann::json j;
    j["owner"] = config.owner.toHex();
    j["data_root"] = config.dataRoot;
    j["http_host"] = config.httpHost;
    j["http_port"] = config.httpPort;
    j["verbose"] = config.verbose;

    persistence.saveTextAsync(configPath, j.dump(4));
    if (!persistence.flush()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        throw std::runtime_error("Cannot write settings file: " + configPath);
    }
}

} // namespace parasitereg::infrastructure
