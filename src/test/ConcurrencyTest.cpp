#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "application/registry/ParasiteRegistryService.hpp"
#include "infrastructure/LogicalClock.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/registry/RegistryEventStoreFs.hpp"
#include "infrastructure/registry/RegistryRepositoryFs.hpp"
#include "test/TestSupport.hpp"

using namespace parasitereg::domain::registry;
using namespace parasitereg::application::registry;
using namespace parasitereg::infrastructure::registry;
using parasitereg::test::MakeDigest;
using parasitereg::test::MakeIdentity;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Use a test-specific data root to avoid cluttering real registry data
    std::string testRoot = "test_registry_root_concurrency";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    const Identity owner = MakeIdentity(0x01);
    const Identity author = MakeIdentity(0x02);

    auto persistence = std::make_shared<parasitereg::infrastructure::PersistenceService>();
    auto eventStore = std::make_unique<RegistryEventStoreFs>(testRoot, persistence);
    auto repo = std::make_shared<RegistryRepositoryFs>(std::move(eventStore));
    auto clock = std::make_shared<parasitereg::infrastructure::LogicalClock>();
    ParasiteRegistryService service(owner, repo, clock, false);

    assert(service.registerInstitution("WHO_AFRICA", "WHO Africa", owner));
    assert(service.verifyInstitution("WHO_AFRICA", owner));
    assert(service.setResearcherMembership(author, "WHO_AFRICA", owner));
    assert(service.addParasiteRecord("Plasmodium vivax", "Apicomplexan", "Horn of Africa",
                                     MakeDigest(0x00), author));

    // Stress Test: every thread tries to supersede record 1.
    const int NUM_UPDATES = 32;
    std::vector<std::thread> threads;
    std::atomic<int> winners{0};
    std::atomic<int> invalidRecord{0};
    std::atomic<int> otherErrors{0};

    std::cout << "[Test] Spawning " << NUM_UPDATES << " threads updating the same version..." << std::endl;

    for (int i = 0; i < NUM_UPDATES; ++i) {
        threads.emplace_back([&, i]() {
            auto result = service.updateParasiteRecord(1, "Plasmodium vivax", "Apicomplexan", "Horn of Africa",
                                                       MakeDigest(static_cast<std::uint8_t>(i + 1)), author);
            if (result) {
                winners++;
            } else if (result.kind() == ErrorKind::InvalidRecord) {
                invalidRecord++;
            } else {
                otherErrors++;
            }
        });
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    std::cout << "[Test] Winners: " << winners << ", InvalidRecord: " << invalidRecord << std::endl;
    assert(winners == 1);
    assert(invalidRecord == NUM_UPDATES - 1);
    assert(otherErrors == 0);

    // Exactly one successor, and the lineage stays linear.
    auto snapshot = service.snapshot();
    assert(snapshot.records.size() == 2);
    assert(snapshot.records.at(1).status == RecordStatus::Archived);
    assert(snapshot.records.at(2).previousVersion == RecordId(1));
    assert(snapshot.records.at(2).isActive());
    assert(service.auditRegistry()["status"] == "pass");

    // Independent lineages: every add succeeds with a unique id.
    threads.clear();
    const int NUM_ADDS = 24;
    std::atomic<int> added{0};
    for (int i = 0; i < NUM_ADDS; ++i) {
        threads.emplace_back([&, i]() {
            auto result = service.addParasiteRecord("Giardia duodenalis", "Diplomonad",
                                                    "Region " + std::to_string(i % 4),
                                                    MakeDigest(0x40), author);
            if (result) added++;
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(added == NUM_ADDS);
    assert(service.getTotalRecords() == static_cast<std::uint64_t>(2 + NUM_ADDS));
    assert(service.getGeographicStats("Region 0")->totalCases == NUM_ADDS / 4);
    assert(service.auditRegistry()["status"] == "pass");

    service.flush();
    persistence->stop();

    // The log replays to the same state.
    {
        auto replayPersistence = std::make_shared<parasitereg::infrastructure::PersistenceService>();
        auto replayRepo = std::make_shared<RegistryRepositoryFs>(
            std::make_unique<RegistryEventStoreFs>(testRoot, replayPersistence));
        auto replayClock = std::make_shared<parasitereg::infrastructure::LogicalClock>();
        ParasiteRegistryService replayed(owner, replayRepo, replayClock, false);
        assert(replayed.snapshot() == service.snapshot());
        replayPersistence->stop();
    }

    // Clean up
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Concurrency Stress Test." << std::endl;
    return 0;
}
