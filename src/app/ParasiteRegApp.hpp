/**
 * @file ParasiteRegApp.hpp
 * @brief Command-line front end for the parasite registry.
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/registry/ParasiteRegistryService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace parasitereg::app {

/**
 * @class ParasiteRegApp
 * @brief Parses arguments, opens the registry and runs one command (or the HTTP server).
 */
class ParasiteRegApp {
public:
    static constexpr int ExitOk = 0;
    static constexpr int ExitRegistryError = 1;
    static constexpr int ExitUsage = 2;

    /**
     * @brief Entry point.
     * @return Exit code: 0 success, 1 registry error, 2 usage or configuration error.
     */
    int Run(int argc, char** argv);

    static void PrintUsage(std::ostream& out);

private:
    /**
     * @brief Splits argv into options (--config, --as) and positional arguments.
     * @return False on a malformed option.
     */
    bool ParseArgs(int argc, char** argv);

    /**
     * @brief Loads configuration and opens the registry service.
     */
    bool Init();

    /** @brief Writes a fresh settings file for `init`; never overwrites one. */
    int InitSettings();

    int Execute();
    int Serve();

    /** @brief Prints `body` as JSON on stdout and returns the exit code. */
    int Emit(const nlohmann::json& body, int exitCode);

    bool RequireArgs(std::size_t count);
    bool RequireCaller();

    std::string m_configPath = "settings.json";
    std::string m_callerHex;
    std::string m_command;
    std::vector<std::string> m_args;

    infrastructure::RegistryConfig m_config;
    std::shared_ptr<application::registry::ParasiteRegistryService> m_service;
    domain::registry::Identity m_caller;
};

} // namespace parasitereg::app
