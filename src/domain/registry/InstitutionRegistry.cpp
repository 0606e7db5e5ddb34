/**
 * @file InstitutionRegistry.cpp
 * @brief Implementation of InstitutionRegistry.
 */

#include "domain/registry/InstitutionRegistry.hpp"
#include "domain/registry/TextRules.hpp"

namespace parasitereg::domain::registry {

InstitutionRegistry::InstitutionRegistry(RegistryState& state,
                                         const AccessControl& access,
                                         SequenceClock& clock,
                                         std::vector<RegistryEvent>& pending)
    : m_state(state), m_access(access), m_clock(clock), m_pending(pending) {}

Result<Unit> InstitutionRegistry::registerInstitution(const InstitutionId& id,
                                                      const std::string& name,
                                                      const Identity& caller) {
    if (auto denied = m_access.authorize(AccessRule::RegistryOwner, caller)) {
        return Result<Unit>::fail(*denied);
    }
    if (id.empty()) {
        return Result<Unit>::fail(ErrorKind::InvalidInput, "Institution id must not be empty.");
    }
    if (auto invalid = CheckTextField("institution_id", id, InstitutionFieldLimits::Id)) {
        return Result<Unit>::fail(*invalid);
    }
    if (auto invalid = CheckTextField("institution name", name, InstitutionFieldLimits::Name)) {
        return Result<Unit>::fail(*invalid);
    }
    if (m_state.institutions.count(id) > 0) {
        return Result<Unit>::fail(ErrorKind::InvalidInstitution, "Institution already registered: " + id);
    }

    InstitutionRegistered evt{id, name, caller, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
    return Result<Unit>::ok(Unit{});
}

Result<Unit> InstitutionRegistry::verifyInstitution(const InstitutionId& id, const Identity& caller) {
    if (auto denied = m_access.authorize(AccessRule::RegistryOwner, caller)) {
        return Result<Unit>::fail(*denied);
    }
    auto it = m_state.institutions.find(id);
    if (it == m_state.institutions.end()) {
        return Result<Unit>::fail(ErrorKind::InvalidInstitution, "Institution not found: " + id);
    }
    if (it->second.isVerified()) {
        return Result<Unit>::ok(Unit{});
    }

    InstitutionVerified evt{id, caller, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
    return Result<Unit>::ok(Unit{});
}

Result<Unit> InstitutionRegistry::transferAdmin(const InstitutionId& id,
                                               const Identity& newAdmin,
                                               const Identity& caller) {
    auto it = m_state.institutions.find(id);
    if (it == m_state.institutions.end()) {
        return Result<Unit>::fail(ErrorKind::InvalidInstitution, "Institution not found: " + id);
    }
    AccessTarget target;
    target.institutionId = &id;
    if (auto denied = m_access.authorize(AccessRule::InstitutionAdminOrOwner, caller, target)) {
        return Result<Unit>::fail(*denied);
    }
    if (it->second.getAdmin() == newAdmin) {
        return Result<Unit>::ok(Unit{});
    }

    InstitutionAdminChanged evt{id, newAdmin, caller, m_clock.advance()};
    apply(evt);
    m_pending.push_back(evt);
    return Result<Unit>::ok(Unit{});
}

std::optional<Institution> InstitutionRegistry::getInstitution(const InstitutionId& id) const {
    auto it = m_state.institutions.find(id);
    if (it == m_state.institutions.end()) return std::nullopt;
    return it->second;
}

void InstitutionRegistry::apply(const InstitutionRegistered& e) {
    m_state.institutions[e.institutionId] = Institution(e.institutionId, e.name, e.admin);
}

void InstitutionRegistry::apply(const InstitutionVerified& e) {
    auto it = m_state.institutions.find(e.institutionId);
    if (it != m_state.institutions.end()) {
        it->second.markVerified();
    }
}

void InstitutionRegistry::apply(const InstitutionAdminChanged& e) {
    auto it = m_state.institutions.find(e.institutionId);
    if (it != m_state.institutions.end()) {
        it->second.setAdmin(e.newAdmin);
    }
}

} // namespace parasitereg::domain::registry
