/**
 * @file ResearcherDirectory.cpp
 * @brief Implementation of ResearcherDirectory.
 */

#include "domain/registry/ResearcherDirectory.hpp"

namespace parasitereg::domain::registry {

ResearcherDirectory::ResearcherDirectory(RegistryState& state,
                                         const AccessControl& access,
                                         SequenceClock& clock,
                                         std::vector<RegistryEvent>& pending)
    : m_state(state), m_access(access), m_clock(clock), m_pending(pending) {}

std::optional<InstitutionId> ResearcherDirectory::membershipOf(const Identity& researcher) const {
    auto it = m_state.memberships.find(researcher);
    if (it == m_state.memberships.end()) return std::nullopt;
    return it->second;
}

Result<Unit> ResearcherDirectory::setMembership(const Identity& researcher,
                                                const InstitutionId& institutionId,
                                                const Identity& caller) {
    // Admin rights are relative to the institution, so it has to exist first.
    if (m_state.institutions.count(institutionId) == 0) {
        return Result<Unit>::fail(ErrorKind::InvalidInstitution, "Institution not found: " + institutionId);
    }
    AccessTarget target;
    target.institutionId = &institutionId;
    if (auto denied = m_access.authorize(AccessRule::InstitutionAdminOrOwner, caller, target)) {
        return Result<Unit>::fail(*denied);
    }

    auto current = m_state.memberships.find(researcher);
    if (current != m_state.memberships.end() && current->second == institutionId) {
        return Result<Unit>::ok(Unit{});
    }

    MembershipAssigned evt{researcher, institutionId, caller, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
    return Result<Unit>::ok(Unit{});
}

Result<Unit> ResearcherDirectory::revokeMembership(const Identity& researcher, const Identity& caller) {
    auto current = m_state.memberships.find(researcher);
    if (current == m_state.memberships.end()) {
        return Result<Unit>::fail(ErrorKind::InvalidInstitution,
                                  "Researcher has no membership: " + researcher.toHex());
    }
    AccessTarget target;
    target.institutionId = &current->second;
    if (auto denied = m_access.authorize(AccessRule::InstitutionAdminOrOwner, caller, target)) {
        return Result<Unit>::fail(*denied);
    }

    MembershipRevoked evt{researcher, caller, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
    return Result<Unit>::ok(Unit{});
}

void ResearcherDirectory::apply(const MembershipAssigned& e) {
    m_state.memberships[e.researcher] = e.institutionId;
}

void ResearcherDirectory::apply(const MembershipRevoked& e) {
    m_state.memberships.erase(e.researcher);
}

} // namespace parasitereg::domain::registry
