#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "application/registry/ParasiteRegistryService.hpp"
#include "infrastructure/LogicalClock.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/http/RegistryHttpServer.hpp"
#include "infrastructure/registry/RegistryEventStoreFs.hpp"
#include "infrastructure/registry/RegistryRepositoryFs.hpp"
#include "test/TestSupport.hpp"

using namespace parasitereg::domain::registry;
using namespace parasitereg::application::registry;
using namespace parasitereg::infrastructure::registry;
using parasitereg::infrastructure::http::RegistryHttpServer;
using parasitereg::test::MakeDigest;
using parasitereg::test::MakeIdentity;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting RegistryHttpServer Test..." << std::endl;

    std::string testRoot = "test_registry_root_http";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    const Identity owner = MakeIdentity(0x01);
    const Identity researcher = MakeIdentity(0x02);

    auto persistence = std::make_shared<parasitereg::infrastructure::PersistenceService>();
    auto eventStore = std::make_unique<RegistryEventStoreFs>(testRoot, persistence);
    const std::string eventsPath = eventStore->getEventsFilePath();
    auto repo = std::make_shared<RegistryRepositoryFs>(std::move(eventStore));
    auto clock = std::make_shared<parasitereg::infrastructure::LogicalClock>();
    auto service = std::make_shared<ParasiteRegistryService>(owner, repo, clock, false);

    assert(service->registerInstitution("WHO_AFRICA", "WHO Africa", owner));
    assert(service->verifyInstitution("WHO_AFRICA", owner));
    assert(service->setResearcherMembership(researcher, "WHO_AFRICA", owner));
    assert(service->addParasiteRecord("Schistosoma haematobium", "Trematode", "100% Sahel",
                                      MakeDigest(0x01), researcher));

    const std::string host = "127.0.0.1";
    const int port = 18431;
    RegistryHttpServer server(service);
    std::thread serverThread([&server, &host, port]() { server.listen(host, port); });

    httplib::Client client(host, port);
    // Wait for the listener to come up.
    bool ready = false;
    for (int i = 0; i < 100 && !ready; ++i) {
        auto res = client.Get("/records/count");
        ready = res && res->status == 200;
        if (!ready) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(ready);

    // Region names are decoded exactly once.
    {
        auto res = client.Get("/geo-stats/100%25%20Sahel");
        assert(res && res->status == 200);
        auto body = json::parse(res->body);
        assert(body["region"] == "100% Sahel");
        assert(body["totalCases"] == 1);
    }

    // Writes need a caller.
    {
        auto res = client.Post("/institutions", R"({"id":"CDC","name":"CDC"})", "application/json");
        assert(res && res->status == 401);
    }

    const httplib::Headers ownerHeaders = {{RegistryHttpServer::CallerHeader, owner.toHex()}};

    // Rejections map to their status and leave nothing behind.
    {
        const httplib::Headers researcherHeaders = {{RegistryHttpServer::CallerHeader, researcher.toHex()}};
        auto res = client.Post("/institutions", researcherHeaders, R"({"id":"CDC","name":"CDC"})", "application/json");
        assert(res && res->status == 403);
        assert(json::parse(res->body)["error"] == "NotAuthorized");
        assert(!service->getInstitutionDetails("CDC"));
    }

    // A write that cannot reach the log is reported as a failure and not applied.
    {
        const RegistryState before = service->snapshot();
        const std::string parked = eventsPath + ".parked";
        std::filesystem::rename(eventsPath, parked);
        std::filesystem::create_directories(eventsPath);

        auto res = client.Post("/institutions", ownerHeaders, R"({"id":"CDC","name":"CDC"})", "application/json");
        assert(res && res->status == 500);
        assert(json::parse(res->body)["error"] == "StorageFault");
        assert(service->snapshot() == before);

        std::filesystem::remove_all(eventsPath);
        std::filesystem::rename(parked, eventsPath);
    }

    {
        auto res = client.Post("/institutions", ownerHeaders, R"({"id":"CDC","name":"CDC"})", "application/json");
        assert(res && res->status == 201);
        assert(service->getInstitutionDetails("CDC"));
    }

    server.stop();
    serverThread.join();
    persistence->stop();

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] RegistryHttpServer Test." << std::endl;
    return 0;
}
