#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "domain/registry/ParasiteRegistry.hpp"
#include "infrastructure/LogicalClock.hpp"
#include "test/TestSupport.hpp"

using namespace parasitereg::domain::registry;
using parasitereg::infrastructure::LogicalClock;
using parasitereg::test::MakeIdentity;

namespace {

void testRegistrationIsOwnerOnly() {
    const Identity owner = MakeIdentity(0x01);
    const Identity stranger = MakeIdentity(0x09);
    LogicalClock clock;
    ParasiteRegistry registry(owner, clock);
    registry.clearUncommittedEvents();

    const RegistryState before = registry.state();
    auto denied = registry.registerInstitution("WHO_AFRICA", "WHO Africa", stranger);
    assert(!denied && denied.kind() == ErrorKind::NotAuthorized);
    assert(registry.state() == before);
    assert(registry.getUncommittedEvents().empty());

    auto ok = registry.registerInstitution("WHO_AFRICA", "WHO Africa", owner);
    assert(ok);
    auto institution = registry.getInstitutionDetails("WHO_AFRICA");
    assert(institution);
    assert(institution->getName() == "WHO Africa");
    assert(!institution->isVerified());
    assert(institution->getAdmin() == owner);
    assert(registry.getUncommittedEvents().size() == 1);
}

void testDuplicateAndInvalidRegistration() {
    const Identity owner = MakeIdentity(0x01);
    LogicalClock clock;
    ParasiteRegistry registry(owner, clock);
    assert(registry.registerInstitution("CDC", "Centers for Disease Control", owner));

    const RegistryState before = registry.state();
    auto duplicate = registry.registerInstitution("CDC", "Another name", owner);
    assert(!duplicate && duplicate.kind() == ErrorKind::InvalidInstitution);
    assert(registry.getInstitutionDetails("CDC")->getName() == "Centers for Disease Control");

    auto emptyId = registry.registerInstitution("", "Nameless", owner);
    assert(!emptyId && emptyId.kind() == ErrorKind::InvalidInput);

    auto longId = registry.registerInstitution(std::string(51, 'X'), "Too long", owner);
    assert(!longId && longId.kind() == ErrorKind::InvalidInput);

    auto longName = registry.registerInstitution("LONG", std::string(101, 'n'), owner);
    assert(!longName && longName.kind() == ErrorKind::InvalidInput);

    // Text must be UTF-8; limits count characters, not bytes.
    auto badId = registry.registerInstitution("WHO_\xD1", "WHO", owner);
    assert(!badId && badId.kind() == ErrorKind::InvalidInput);
    auto badName = registry.registerInstitution("WHO_EMRO", "Bureau r\xE9gional", owner);
    assert(!badName && badName.kind() == ErrorKind::InvalidInput);

    assert(registry.state() == before);

    std::string accented;
    for (int i = 0; i < 50; ++i) accented += "\xC3\xA9"; // 50 x U+00E9, 100 bytes
    assert(registry.registerInstitution(accented, "Institut", owner));
    auto tooManyChars = registry.registerInstitution(accented + "e", "Institut", owner);
    assert(!tooManyChars && tooManyChars.kind() == ErrorKind::InvalidInput);
}

void testVerification() {
    const Identity owner = MakeIdentity(0x01);
    const Identity stranger = MakeIdentity(0x09);
    LogicalClock clock;
    ParasiteRegistry registry(owner, clock);
    assert(registry.registerInstitution("WHO_AFRICA", "WHO Africa", owner));
    registry.clearUncommittedEvents();

    const RegistryState before = registry.state();
    const std::uint64_t sequence = clock.current();
    auto denied = registry.verifyInstitution("WHO_AFRICA", stranger);
    assert(!denied && denied.kind() == ErrorKind::NotAuthorized);
    assert(registry.state() == before);
    assert(registry.getUncommittedEvents().empty());
    assert(clock.current() == sequence);
    assert(!registry.getInstitutionDetails("WHO_AFRICA")->isVerified());

    auto unknown = registry.verifyInstitution("NOPE", owner);
    assert(!unknown && unknown.kind() == ErrorKind::InvalidInstitution);

    // Authorization is checked before existence.
    auto unknownByStranger = registry.verifyInstitution("NOPE", stranger);
    assert(!unknownByStranger && unknownByStranger.kind() == ErrorKind::NotAuthorized);

    assert(registry.verifyInstitution("WHO_AFRICA", owner));
    assert(registry.getInstitutionDetails("WHO_AFRICA")->isVerified());

    // Verifying twice is a successful no-op.
    registry.clearUncommittedEvents();
    const std::uint64_t repeatSequence = clock.current();
    assert(registry.verifyInstitution("WHO_AFRICA", owner));
    assert(registry.getUncommittedEvents().empty());
    assert(clock.current() == repeatSequence);
}

void testAdminTransferAndMembership() {
    const Identity owner = MakeIdentity(0x01);
    const Identity admin = MakeIdentity(0x02);
    const Identity researcher = MakeIdentity(0x03);
    const Identity stranger = MakeIdentity(0x09);
    LogicalClock clock;
    ParasiteRegistry registry(owner, clock);
    assert(registry.registerInstitution("WHO_AFRICA", "WHO Africa", owner));
    assert(registry.registerInstitution("CDC", "CDC", owner));

    auto strangerTransfer = registry.transferInstitutionAdmin("WHO_AFRICA", stranger, stranger);
    assert(!strangerTransfer && strangerTransfer.kind() == ErrorKind::NotAuthorized);
    auto unknownTransfer = registry.transferInstitutionAdmin("NOPE", admin, owner);
    assert(!unknownTransfer && unknownTransfer.kind() == ErrorKind::InvalidInstitution);

    assert(registry.transferInstitutionAdmin("WHO_AFRICA", admin, owner));
    assert(registry.getInstitutionDetails("WHO_AFRICA")->getAdmin() == admin);

    // The new admin can assign members of its own institution only.
    assert(registry.setResearcherMembership(researcher, "WHO_AFRICA", admin));
    assert(registry.getResearcherMembership(researcher) == InstitutionId("WHO_AFRICA"));

    auto foreign = registry.setResearcherMembership(researcher, "CDC", admin);
    assert(!foreign && foreign.kind() == ErrorKind::NotAuthorized);
    assert(registry.getResearcherMembership(researcher) == InstitutionId("WHO_AFRICA"));

    auto unknownInstitution = registry.setResearcherMembership(researcher, "NOPE", owner);
    assert(!unknownInstitution && unknownInstitution.kind() == ErrorKind::InvalidInstitution);

    auto strangerAssign = registry.setResearcherMembership(stranger, "WHO_AFRICA", stranger);
    assert(!strangerAssign && strangerAssign.kind() == ErrorKind::NotAuthorized);
    assert(!registry.getResearcherMembership(stranger));

    // The owner may reassign anyone.
    assert(registry.setResearcherMembership(researcher, "CDC", owner));
    assert(registry.getResearcherMembership(researcher) == InstitutionId("CDC"));

    // Revocation: only the admin of the current institution (owner for CDC) or the owner.
    auto wrongAdmin = registry.revokeResearcherMembership(researcher, admin);
    assert(!wrongAdmin && wrongAdmin.kind() == ErrorKind::NotAuthorized);
    assert(registry.revokeResearcherMembership(researcher, owner));
    assert(!registry.getResearcherMembership(researcher));

    auto noMembership = registry.revokeResearcherMembership(researcher, owner);
    assert(!noMembership && noMembership.kind() == ErrorKind::InvalidInstitution);
}

} // namespace

int main() {
    std::cout << "[Test] Starting InstitutionRegistry Test..." << std::endl;
    testRegistrationIsOwnerOnly();
    testDuplicateAndInvalidRegistration();
    testVerification();
    testAdminTransferAndMembership();
    std::cout << "[PASS] InstitutionRegistry Test." << std::endl;
    return 0;
}
