/**
 * @file ParasiteRegApp.cpp
 * @brief Implementation of the ParasiteRegApp class.
 */
#include "app/ParasiteRegApp.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "infrastructure/LogicalClock.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/http/RegistryHttpServer.hpp"
#include "infrastructure/registry/RegistryEventStoreFs.hpp"
#include "infrastructure/registry/RegistryJson.hpp"
#include "infrastructure/registry/RegistryRepositoryFs.hpp"

namespace parasitereg::app {

using json = nlohmann::json;
using namespace parasitereg::domain::registry;
using namespace parasitereg::infrastructure::registry;

namespace {

std::optional<RecordId> ParseRecordId(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<RecordId>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

json UsageError(const std::string& message) {
    return {{"error", "Usage"}, {"message", message}};
}

} // namespace

void ParasiteRegApp::PrintUsage(std::ostream& out) {
    out << "Usage: parasitereg [--config settings.json] [--as <identity-hex>] <command> [args]\n"
           "\n"
           "Setup:\n"
           "  init <owner-hex> [data-root]   Write a new settings file.\n"
           "\n"
           "Writes (require --as):\n"
           "  add-record <name> <classification> <location> <metadata-hash>\n"
           "  update-record <id> <name> <classification> <location> <metadata-hash>\n"
           "  register-institution <id> <name>\n"
           "  verify-institution <id>\n"
           "  set-institution-admin <id> <admin-hex>\n"
           "  set-membership <researcher-hex> <institution-id>\n"
           "  revoke-membership <researcher-hex>\n"
           "\n"
           "Reads:\n"
           "  get-record <id>\n"
           "  history <id>\n"
           "  geo-stats <region>\n"
           "  institution <id>\n"
           "  membership <researcher-hex>\n"
           "  total\n"
           "  owner\n"
           "  audit\n"
           "\n"
           "  serve                 Run the HTTP API from the configured host/port.\n";
}

int ParasiteRegApp::Run(int argc, char** argv) {
    if (!ParseArgs(argc, argv)) {
        PrintUsage(std::cerr);
        return ExitUsage;
    }
    if (m_command == "help") {
        PrintUsage(std::cout);
        return ExitOk;
    }
    if (m_command == "init") {
        try {
            return InitSettings();
        } catch (const std::exception& e) {
            std::cerr << "[ParasiteRegApp] " << e.what() << std::endl;
            return Emit({{"error", "StorageFault"}, {"message", e.what()}}, ExitRegistryError);
        }
    }
    if (!Init()) {
        return ExitUsage;
    }

    try {
        return (m_command == "serve") ? Serve() : Execute();
    } catch (const std::exception& e) {
        std::cerr << "[ParasiteRegApp] " << e.what() << std::endl;
        return Emit({{"error", "StorageFault"}, {"message", e.what()}}, ExitRegistryError);
    }
}

bool ParasiteRegApp::ParseArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--as") {
            if (i + 1 >= argc) {
                std::cerr << "[ParasiteRegApp] Missing value for " << arg << std::endl;
                return false;
            }
            (arg == "--config" ? m_configPath : m_callerHex) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            m_command = "help";
            return true;
        } else if (m_command.empty()) {
            m_command = arg;
        } else {
            m_args.push_back(arg);
        }
    }
    if (m_command.empty()) {
        std::cerr << "[ParasiteRegApp] No command given." << std::endl;
        return false;
    }
    return true;
}

bool ParasiteRegApp::Init() {
    try {
        m_config = infrastructure::ConfigLoader::Load(m_configPath);
    } catch (const std::exception& e) {
        std::cerr << "[ParasiteRegApp] " << e.what() << std::endl;
        return false;
    }

    try {
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        auto eventStore = std::make_unique<RegistryEventStoreFs>(m_config.dataRoot, persistence);
        auto repository = std::make_shared<RegistryRepositoryFs>(std::move(eventStore));
        auto clock = std::make_shared<infrastructure::LogicalClock>();
        m_service = std::make_shared<application::registry::ParasiteRegistryService>(
            m_config.owner, repository, clock, m_config.verbose);
    } catch (const std::exception& e) {
        std::cerr << "[ParasiteRegApp] Cannot open registry in " << m_config.dataRoot << ": "
                  << e.what() << std::endl;
        return false;
    }
    return true;
}

int ParasiteRegApp::InitSettings() {
    if (m_args.empty() || m_args.size() > 2) {
        return Emit(UsageError("init expects <owner-hex> [data-root]."), ExitUsage);
    }
    auto owner = Identity::fromHex(m_args[0]);
    if (!owner) return Emit(UsageError("owner must be a 40-char hex identity."), ExitUsage);
    if (std::filesystem::exists(m_configPath)) {
        return Emit(UsageError(m_configPath + " already exists."), ExitUsage);
    }

    infrastructure::RegistryConfig config;
    config.owner = *owner;
    if (m_args.size() == 2) config.dataRoot = m_args[1];

    infrastructure::PersistenceService persistence;
    infrastructure::ConfigLoader::Save(m_configPath, config, persistence);
    return Emit({{"config", m_configPath}, {"owner", owner->toHex()}, {"data_root", config.dataRoot}}, ExitOk);
}

int ParasiteRegApp::Emit(const json& body, int exitCode) {
    // Arguments echoed back in messages may hold bytes that are not UTF-8.
    std::cout << body.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return exitCode;
}

bool ParasiteRegApp::RequireArgs(std::size_t count) {
    if (m_args.size() == count) return true;
    Emit(UsageError(m_command + " expects " + std::to_string(count) + " argument(s)."), ExitUsage);
    return false;
}

bool ParasiteRegApp::RequireCaller() {
    auto caller = Identity::fromHex(m_callerHex);
    if (!caller) {
        Emit(UsageError(m_command + " requires --as <40-char hex identity>."), ExitUsage);
        return false;
    }
    m_caller = *caller;
    return true;
}

int ParasiteRegApp::Execute() {
    auto unitResult = [this](const Result<Unit>& result) {
        if (!result) return Emit(ErrorToJson(result.error()), ExitRegistryError);
        return Emit({{"ok", true}}, ExitOk);
    };
    auto idResult = [this](const Result<RecordId>& result) {
        if (!result) return Emit(ErrorToJson(result.error()), ExitRegistryError);
        return Emit({{"id", result.value()}}, ExitOk);
    };

    if (m_command == "add-record") {
        if (!RequireArgs(4) || !RequireCaller()) return ExitUsage;
        auto digest = MetadataDigest::fromHex(m_args[3]);
        if (!digest) return Emit(UsageError("metadata-hash must be 64 hex characters."), ExitUsage);
        return idResult(m_service->addParasiteRecord(m_args[0], m_args[1], m_args[2], *digest, m_caller));
    }
    if (m_command == "update-record") {
        if (!RequireArgs(5) || !RequireCaller()) return ExitUsage;
        auto id = ParseRecordId(m_args[0]);
        auto digest = MetadataDigest::fromHex(m_args[4]);
        if (!id) return Emit(UsageError("Record id must be an unsigned integer."), ExitUsage);
        if (!digest) return Emit(UsageError("metadata-hash must be 64 hex characters."), ExitUsage);
        return idResult(m_service->updateParasiteRecord(*id, m_args[1], m_args[2], m_args[3], *digest, m_caller));
    }
    if (m_command == "register-institution") {
        if (!RequireArgs(2) || !RequireCaller()) return ExitUsage;
        return unitResult(m_service->registerInstitution(m_args[0], m_args[1], m_caller));
    }
    if (m_command == "verify-institution") {
        if (!RequireArgs(1) || !RequireCaller()) return ExitUsage;
        return unitResult(m_service->verifyInstitution(m_args[0], m_caller));
    }
    if (m_command == "set-institution-admin") {
        if (!RequireArgs(2) || !RequireCaller()) return ExitUsage;
        auto newAdmin = Identity::fromHex(m_args[1]);
        if (!newAdmin) return Emit(UsageError("admin must be a 40-char hex identity."), ExitUsage);
        return unitResult(m_service->transferInstitutionAdmin(m_args[0], *newAdmin, m_caller));
    }
    if (m_command == "set-membership") {
        if (!RequireArgs(2) || !RequireCaller()) return ExitUsage;
        auto researcher = Identity::fromHex(m_args[0]);
        if (!researcher) return Emit(UsageError("researcher must be a 40-char hex identity."), ExitUsage);
        return unitResult(m_service->setResearcherMembership(*researcher, m_args[1], m_caller));
    }
    if (m_command == "revoke-membership") {
        if (!RequireArgs(1) || !RequireCaller()) return ExitUsage;
        auto researcher = Identity::fromHex(m_args[0]);
        if (!researcher) return Emit(UsageError("researcher must be a 40-char hex identity."), ExitUsage);
        return unitResult(m_service->revokeResearcherMembership(*researcher, m_caller));
    }
    if (m_command == "get-record") {
        if (!RequireArgs(1)) return ExitUsage;
        auto id = ParseRecordId(m_args[0]);
        if (!id) return Emit(UsageError("Record id must be an unsigned integer."), ExitUsage);
        auto record = m_service->getParasiteRecord(*id);
        return record ? Emit(RecordToJson(*record), ExitOk) : Emit(json(nullptr), ExitOk);
    }
    if (m_command == "history") {
        if (!RequireArgs(1)) return ExitUsage;
        auto id = ParseRecordId(m_args[0]);
        if (!id) return Emit(UsageError("Record id must be an unsigned integer."), ExitUsage);
        auto history = m_service->getParasiteRecordHistory(*id);
        if (!history) return Emit(ErrorToJson(history.error()), ExitRegistryError);
        return Emit(HistoryToJson(history.value()), ExitOk);
    }
    if (m_command == "geo-stats") {
        if (!RequireArgs(1)) return ExitUsage;
        auto stat = m_service->getGeographicStats(m_args[0]);
        return stat ? Emit(GeoStatToJson(*stat), ExitOk) : Emit(json(nullptr), ExitOk);
    }
    if (m_command == "institution") {
        if (!RequireArgs(1)) return ExitUsage;
        auto institution = m_service->getInstitutionDetails(m_args[0]);
        return institution ? Emit(InstitutionToJson(*institution), ExitOk) : Emit(json(nullptr), ExitOk);
    }
    if (m_command == "membership") {
        if (!RequireArgs(1)) return ExitUsage;
        auto researcher = Identity::fromHex(m_args[0]);
        if (!researcher) return Emit(UsageError("researcher must be a 40-char hex identity."), ExitUsage);
        auto membership = m_service->getResearcherMembership(*researcher);
        return membership ? Emit(json(*membership), ExitOk) : Emit(json(nullptr), ExitOk);
    }
    if (m_command == "total") {
        return Emit({{"total", m_service->getTotalRecords()}}, ExitOk);
    }
    if (m_command == "owner") {
        return Emit({{"owner", m_service->getRegistryOwner().toHex()}}, ExitOk);
    }
    if (m_command == "audit") {
        auto report = m_service->auditRegistry();
        return Emit(report, report["status"] == "pass" ? ExitOk : ExitRegistryError);
    }

    std::cerr << "[ParasiteRegApp] Unknown command: " << m_command << std::endl;
    PrintUsage(std::cerr);
    return ExitUsage;
}

int ParasiteRegApp::Serve() {
    infrastructure::http::RegistryHttpServer server(m_service);
    return server.listen(m_config.httpHost, m_config.httpPort) ? ExitOk : ExitRegistryError;
}

} // namespace parasitereg::app
