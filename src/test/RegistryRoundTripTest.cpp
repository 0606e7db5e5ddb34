#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "application/registry/ParasiteRegistryService.hpp"
#include "infrastructure/LogicalClock.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/registry/RegistryEventStoreFs.hpp"
#include "infrastructure/registry/RegistryRepositoryFs.hpp"
#include "test/TestSupport.hpp"

using namespace parasitereg::domain::registry;
using namespace parasitereg::application::registry;
using namespace parasitereg::infrastructure::registry;
using parasitereg::infrastructure::LogicalClock;
using parasitereg::infrastructure::PersistenceService;
using parasitereg::test::MakeDigest;
using parasitereg::test::MakeIdentity;

namespace {

const Identity kOwner = MakeIdentity(0x11);
const Identity kAdmin = MakeIdentity(0x22);
const Identity kResearcher = MakeIdentity(0x33);

struct Stack {
    std::shared_ptr<PersistenceService> persistence;
    std::shared_ptr<RegistryRepositoryFs> repository;
    std::shared_ptr<LogicalClock> clock;
    std::string eventsPath;
};

Stack OpenStack(const std::string& root) {
    Stack stack;
    stack.persistence = std::make_shared<PersistenceService>();
    auto eventStore = std::make_unique<RegistryEventStoreFs>(root, stack.persistence);
    stack.eventsPath = eventStore->getEventsFilePath();
    stack.repository = std::make_shared<RegistryRepositoryFs>(std::move(eventStore));
    stack.clock = std::make_shared<LogicalClock>();
    return stack;
}

void testReopenRestoresEveryTable(const std::string& root) {
    RegistryState before;
    std::uint64_t sequenceBefore = 0;
    {
        Stack stack = OpenStack(root);
        ParasiteRegistryService service(kOwner, stack.repository, stack.clock, false);

        assert(service.registerInstitution("WHO_AFRICA", "WHO Africa", kOwner));
        assert(service.registerInstitution("PASTEUR", "Institut Pasteur", kOwner));
        assert(service.verifyInstitution("WHO_AFRICA", kOwner));
        assert(service.transferInstitutionAdmin("WHO_AFRICA", kAdmin, kOwner));
        assert(service.setResearcherMembership(kAdmin, "WHO_AFRICA", kAdmin));
        assert(service.setResearcherMembership(kResearcher, "WHO_AFRICA", kAdmin));

        auto id = service.addParasiteRecord("Onchocerca volvulus", "Nematode", "Volta Basin",
                                            MakeDigest(0x01), kResearcher);
        assert(id && id.value() == 1);
        assert(service.updateParasiteRecord(1, "Onchocerca volvulus", "Nematode", "Volta Basin",
                                            MakeDigest(0x02), kAdmin));
        assert(service.addParasiteRecord("Wuchereria bancrofti", "Nematode", "Niger Delta",
                                         MakeDigest(0x03), kResearcher));

        // A rejected write leaves nothing in the log.
        auto rejected = service.updateParasiteRecord(1, "x", "y", "z", MakeDigest(0x04), kResearcher);
        assert(!rejected && rejected.kind() == ErrorKind::InvalidRecord);

        service.flush();
        before = service.snapshot();
        sequenceBefore = stack.clock->current();
        stack.persistence->stop();
    }

    assert(std::filesystem::exists(std::filesystem::path(root) / "registry" / "events.ndjson"));

    Stack stack = OpenStack(root);
    ParasiteRegistryService reopened(kOwner, stack.repository, stack.clock, false);
    assert(reopened.snapshot() == before);
    assert(reopened.getTotalRecords() == 3);
    assert(reopened.getRegistryOwner() == kOwner);
    assert(reopened.getParasiteRecord(1)->status == RecordStatus::Archived);
    assert(reopened.getParasiteRecord(2)->previousVersion == RecordId(1));
    assert(reopened.getGeographicStats("Volta Basin")->totalCases == 2);
    assert(reopened.getInstitutionDetails("WHO_AFRICA")->getAdmin() == kAdmin);
    assert(!reopened.getInstitutionDetails("PASTEUR")->isVerified());
    assert(reopened.auditRegistry()["status"] == "pass");

    // The clock resumes past every replayed sequence value.
    assert(stack.clock->current() >= sequenceBefore);
    auto next = reopened.addParasiteRecord("Loa loa", "Nematode", "Congo Basin", MakeDigest(0x05), kResearcher);
    assert(next && next.value() == 4);
    assert(reopened.getParasiteRecord(4)->recordedAt > reopened.getParasiteRecord(3)->recordedAt);
    reopened.flush();
    stack.persistence->stop();
}

void testOwnerMismatchIsRejected(const std::string& root) {
    Stack stack = OpenStack(root);
    bool threw = false;
    try {
        ParasiteRegistryService service(MakeIdentity(0x99), stack.repository, stack.clock, false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    stack.persistence->stop();
}

void testCorruptedLogIsRejected(const std::string& root) {
    {
        Stack stack = OpenStack(root);
        std::ofstream log(stack.eventsPath, std::ios::app);
        log << "{\"type\":\"RecordCreated\",\"seq\":\n";
        stack.persistence->stop();
    }

    Stack stack = OpenStack(root);
    bool threw = false;
    try {
        ParasiteRegistryService service(kOwner, stack.repository, stack.clock, false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    stack.persistence->stop();
}

void testNonUtf8FieldsNeverReachTheLog(const std::string& root) {
    RegistryState before;
    {
        Stack stack = OpenStack(root);
        ParasiteRegistryService service(kOwner, stack.repository, stack.clock, false);
        assert(service.registerInstitution("WHO_AFRICA", "WHO Africa", kOwner));
        assert(service.verifyInstitution("WHO_AFRICA", kOwner));
        assert(service.setResearcherMembership(kResearcher, "WHO_AFRICA", kOwner));
        before = service.snapshot();

        auto rejected = service.addParasiteRecord("Plasmodium \xD1", "Apicomplexan", "Sahel",
                                                  MakeDigest(0x01), kResearcher);
        assert(!rejected && rejected.kind() == ErrorKind::InvalidInput);
        auto badInstitution = service.registerInstitution("NIH\xFF", "NIH", kOwner);
        assert(!badInstitution && badInstitution.kind() == ErrorKind::InvalidInput);
        assert(service.snapshot() == before);

        // The service keeps accepting writes.
        auto accepted = service.addParasiteRecord("Plasmodium ovale", "Apicomplexan", "Sahel",
                                                  MakeDigest(0x02), kResearcher);
        assert(accepted && accepted.value() == 1);
        before = service.snapshot();
        stack.persistence->stop();
    }

    Stack stack = OpenStack(root);
    ParasiteRegistryService reopened(kOwner, stack.repository, stack.clock, false);
    assert(reopened.snapshot() == before);
    assert(reopened.getTotalRecords() == 1);
    stack.persistence->stop();
}

void testFailedWriteIsRolledBack(const std::string& root) {
    Stack stack = OpenStack(root);
    ParasiteRegistryService service(kOwner, stack.repository, stack.clock, false);
    assert(service.registerInstitution("WHO_AFRICA", "WHO Africa", kOwner));
    assert(service.verifyInstitution("WHO_AFRICA", kOwner));
    assert(service.setResearcherMembership(kResearcher, "WHO_AFRICA", kOwner));
    const RegistryState before = service.snapshot();

    // Put a directory where the log lives so the next append cannot open it.
    const std::string parked = stack.eventsPath + ".parked";
    std::filesystem::rename(stack.eventsPath, parked);
    std::filesystem::create_directories(stack.eventsPath);

    bool threw = false;
    try {
        service.addParasiteRecord("Trichuris trichiura", "Nematode", "Mekong", MakeDigest(0x03), kResearcher);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(service.snapshot() == before);
    assert(service.getTotalRecords() == 0);
    assert(!service.getGeographicStats("Mekong"));

    threw = false;
    try {
        service.registerInstitution("CDC", "Centers for Disease Control", kOwner);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!service.getInstitutionDetails("CDC"));

    // Once the log is back, writes succeed and reuse the id that was never committed.
    std::filesystem::remove_all(stack.eventsPath);
    std::filesystem::rename(parked, stack.eventsPath);
    auto id = service.addParasiteRecord("Trichuris trichiura", "Nematode", "Mekong", MakeDigest(0x03), kResearcher);
    assert(id && id.value() == 1);
    const RegistryState after = service.snapshot();
    stack.persistence->stop();

    Stack reopenedStack = OpenStack(root);
    ParasiteRegistryService reopened(kOwner, reopenedStack.repository, reopenedStack.clock, false);
    assert(reopened.snapshot() == after);
    reopenedStack.persistence->stop();
}

void testUnknownEventTypeIsRejected() {
    StoredEvent stored;
    stored.eventType = "RecordDeleted";
    stored.eventDataJson = "{}";
    stored.sequence = 7;

    bool threw = false;
    try {
        RegistryRepositoryFs::deserializeEvent(stored);
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Registry Round-Trip Test..." << std::endl;

    std::string testRoot = "test_registry_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    testReopenRestoresEveryTable(testRoot);
    testOwnerMismatchIsRejected(testRoot);
    testCorruptedLogIsRejected(testRoot);
    testUnknownEventTypeIsRejected();

    std::filesystem::remove_all(testRoot);
    testNonUtf8FieldsNeverReachTheLog(testRoot);

    std::filesystem::remove_all(testRoot);
    testFailedWriteIsRolledBack(testRoot);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Registry Round-Trip Test." << std::endl;
    return 0;
}
