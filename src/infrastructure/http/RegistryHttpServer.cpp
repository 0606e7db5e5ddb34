/**
 * @file RegistryHttpServer.cpp
 * @brief Implementation of RegistryHttpServer.
 */

#include "infrastructure/http/RegistryHttpServer.hpp"
#include "infrastructure/registry/RegistryJson.hpp"

#include <httplib.h>
#include <iostream>
#include <optional>

namespace parasitereg::infrastructure::http {

using json = nlohmann::json;
using namespace parasitereg::domain::registry;
using infrastructure::registry::ErrorToJson;
using infrastructure::registry::GeoStatToJson;
using infrastructure::registry::HistoryToJson;
using infrastructure::registry::InstitutionToJson;
using infrastructure::registry::RecordToJson;

namespace {

void Reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void ReplyError(httplib::Response& res, int status, const std::string& kind, const std::string& message) {
    Reply(res, status, {{"error", kind}, {"message", message}});
}

void ReplyRegistryError(httplib::Response& res, const RegistryError& error) {
    Reply(res, RegistryHttpServer::StatusFor(error.kind), ErrorToJson(error));
}

std::optional<Identity> CallerOf(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_header(RegistryHttpServer::CallerHeader)) {
        ReplyError(res, 401, "Unauthenticated", "Missing X-Caller-Identity header.");
        return std::nullopt;
    }
    auto caller = Identity::fromHex(req.get_header_value(RegistryHttpServer::CallerHeader));
    if (!caller) {
        ReplyError(res, 401, "Unauthenticated", "X-Caller-Identity is not a 40-char hex identity.");
        return std::nullopt;
    }
    return caller;
}

std::optional<json> BodyOf(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = json::parse(req.body);
        if (!body.is_object()) {
            ReplyError(res, 400, "InvalidInput", "Request body must be a JSON object.");
            return std::nullopt;
        }
        return body;
    } catch (const json::parse_error& e) {
        ReplyError(res, 400, "InvalidInput", std::string("Malformed JSON: ") + e.what());
        return std::nullopt;
    }
}

std::optional<RecordId> RecordIdOf(const std::string& text, httplib::Response& res) {
    try {
        return static_cast<RecordId>(std::stoull(text));
    } catch (const std::exception&) {
        ReplyError(res, 400, "InvalidInput", "Record id must be an unsigned integer.");
        return std::nullopt;
    }
}

struct SubmissionFields {
    std::string parasiteName;
    std::string classification;
    std::string location;
    MetadataDigest metadataHash;
};

std::optional<SubmissionFields> SubmissionOf(const json& body, httplib::Response& res) {
    try {
        SubmissionFields fields;
        fields.parasiteName = body.at("parasiteName").get<std::string>();
        fields.classification = body.at("classification").get<std::string>();
        fields.location = body.at("location").get<std::string>();
        auto digest = MetadataDigest::fromHex(body.at("metadataHash").get<std::string>());
        if (!digest) {
            ReplyError(res, 400, "InvalidInput", "metadataHash must be 64 hex characters.");
            return std::nullopt;
        }
        fields.metadataHash = *digest;
        return fields;
    } catch (const json::exception& e) {
        ReplyError(res, 400, "InvalidInput", std::string("Missing or invalid field: ") + e.what());
        return std::nullopt;
    }
}

// Persistence faults become a 500 with a JSON body instead of escaping into httplib.
template <typename Handler>
httplib::Server::Handler Guarded(Handler handler) {
    return [handler](const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& e) {
            std::cerr << "[RegistryHttpServer] " << req.method << " " << req.path << " failed: "
                      << e.what() << std::endl;
            ReplyError(res, 500, "StorageFault", e.what());
        }
    };
}

} // namespace

RegistryHttpServer::RegistryHttpServer(std::shared_ptr<application::registry::ParasiteRegistryService> service)
    : m_service(std::move(service)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

RegistryHttpServer::~RegistryHttpServer() {
    stop();
}

int RegistryHttpServer::StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAuthorized: return 403;
        case ErrorKind::NotVerified: return 403;
        case ErrorKind::InvalidRecord: return 404;
        case ErrorKind::InvalidInstitution: return 404;
        case ErrorKind::InvalidInput: return 400;
        default: return 500;
    }
}

bool RegistryHttpServer::listen(const std::string& host, int port) {
    std::clog << "[RegistryHttpServer] Listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[RegistryHttpServer] Failed to bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

void RegistryHttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

void RegistryHttpServer::registerRoutes() {
    auto service = m_service;

    // --- Records ---
    m_server->Post("/records", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto body = BodyOf(req, res);
        if (!body) return;
        auto fields = SubmissionOf(*body, res);
        if (!fields) return;

        auto result = service->addParasiteRecord(fields->parasiteName, fields->classification,
                                                 fields->location, fields->metadataHash, *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 201, {{"id", result.value()}});
    }));

    m_server->Post(R"(/records/(\d+)/versions)", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto id = RecordIdOf(req.matches[1], res);
        if (!id) return;
        auto body = BodyOf(req, res);
        if (!body) return;
        auto fields = SubmissionOf(*body, res);
        if (!fields) return;

        auto result = service->updateParasiteRecord(*id, fields->parasiteName, fields->classification,
                                                    fields->location, fields->metadataHash, *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 201, {{"id", result.value()}});
    }));

    m_server->Get("/records/count", Guarded([service](const httplib::Request&, httplib::Response& res) {
        Reply(res, 200, {{"total", service->getTotalRecords()}});
    }));

    m_server->Get(R"(/records/(\d+))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto id = RecordIdOf(req.matches[1], res);
        if (!id) return;
        auto record = service->getParasiteRecord(*id);
        if (!record) return ReplyError(res, 404, "InvalidRecord", "Record not found.");
        Reply(res, 200, RecordToJson(*record));
    }));

    m_server->Get(R"(/records/(\d+)/history)", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto id = RecordIdOf(req.matches[1], res);
        if (!id) return;
        auto history = service->getParasiteRecordHistory(*id);
        if (!history) return ReplyRegistryError(res, history.error());
        Reply(res, 200, HistoryToJson(history.value()));
    }));

    // --- Institutions ---
    m_server->Post("/institutions", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto body = BodyOf(req, res);
        if (!body) return;
        if (!body->contains("id") || !(*body)["id"].is_string() ||
            !body->contains("name") || !(*body)["name"].is_string()) {
            return ReplyError(res, 400, "InvalidInput", "Fields 'id' and 'name' are required strings.");
        }
        auto result = service->registerInstitution((*body)["id"].get<std::string>(),
                                                   (*body)["name"].get<std::string>(), *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 201, {{"id", (*body)["id"]}});
    }));

    m_server->Post(R"(/institutions/([^/]+)/verify)", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto result = service->verifyInstitution(req.matches[1], *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 200, {{"id", std::string(req.matches[1])}, {"verified", true}});
    }));

    m_server->Put(R"(/institutions/([^/]+)/admin)", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto body = BodyOf(req, res);
        if (!body) return;
        if (!body->contains("admin") || !(*body)["admin"].is_string()) {
            return ReplyError(res, 400, "InvalidInput", "Field 'admin' is required.");
        }
        auto newAdmin = Identity::fromHex((*body)["admin"].get<std::string>());
        if (!newAdmin) return ReplyError(res, 400, "InvalidInput", "admin must be a 40-char hex identity.");
        auto result = service->transferInstitutionAdmin(req.matches[1], *newAdmin, *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 200, {{"id", std::string(req.matches[1])}, {"admin", newAdmin->toHex()}});
    }));

    m_server->Get(R"(/institutions/([^/]+))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto institution = service->getInstitutionDetails(req.matches[1]);
        if (!institution) return ReplyError(res, 404, "InvalidInstitution", "Institution not found.");
        Reply(res, 200, InstitutionToJson(*institution));
    }));

    // --- Memberships ---
    m_server->Put(R"(/memberships/([0-9a-fA-F]{40}))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto researcher = Identity::fromHex(req.matches[1]);
        auto body = BodyOf(req, res);
        if (!body) return;
        if (!body->contains("institutionId") || !(*body)["institutionId"].is_string()) {
            return ReplyError(res, 400, "InvalidInput", "Field 'institutionId' is required.");
        }
        const std::string institutionId = (*body)["institutionId"].get<std::string>();
        auto result = service->setResearcherMembership(*researcher, institutionId, *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        Reply(res, 200, {{"researcher", researcher->toHex()}, {"institutionId", institutionId}});
    }));

    m_server->Delete(R"(/memberships/([0-9a-fA-F]{40}))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto caller = CallerOf(req, res);
        if (!caller) return;
        auto researcher = Identity::fromHex(req.matches[1]);
        auto result = service->revokeResearcherMembership(*researcher, *caller);
        if (!result) return ReplyRegistryError(res, result.error());
        res.status = 204;
    }));

    m_server->Get(R"(/memberships/([0-9a-fA-F]{40}))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto researcher = Identity::fromHex(req.matches[1]);
        auto membership = service->getResearcherMembership(*researcher);
        if (!membership) return ReplyError(res, 404, "InvalidInstitution", "Researcher has no membership.");
        Reply(res, 200, {{"researcher", researcher->toHex()}, {"institutionId", *membership}});
    }));

    // --- Aggregates ---
    m_server->Get(R"(/geo-stats/(.+))", Guarded([service](const httplib::Request& req, httplib::Response& res) {
        auto stat = service->getGeographicStats(req.matches[1]);
        if (!stat) return ReplyError(res, 404, "NotFound", "No records for this region.");
        Reply(res, 200, GeoStatToJson(*stat));
    }));

    m_server->Get("/audit", Guarded([service](const httplib::Request&, httplib::Response& res) {
        auto report = service->auditRegistry();
        Reply(res, report["status"] == "pass" ? 200 : 500, report);
    }));
}

} // namespace parasitereg::infrastructure::http
