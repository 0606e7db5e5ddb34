/**
 * @file AccessControl.cpp
 * @brief Implementation of AccessControl.
 */

#include "domain/registry/AccessControl.hpp"

namespace parasitereg::domain::registry {

bool AccessControl::isOwner(const Identity& caller) const {
    return caller == m_state.owner;
}

bool AccessControl::isInstitutionAdmin(const Identity& caller, const InstitutionId& institutionId) const {
    auto it = m_state.institutions.find(institutionId);
    return it != m_state.institutions.end() && it->second.getAdmin() == caller;
}

bool AccessControl::isVerifiedMember(const Identity& caller) const {
    auto membership = m_state.memberships.find(caller);
    if (membership == m_state.memberships.end()) return false;
    auto institution = m_state.institutions.find(membership->second);
    return institution != m_state.institutions.end() && institution->second.isVerified();
}

std::optional<RegistryError> AccessControl::authorize(AccessRule rule,
                                                      const Identity& caller,
                                                      const AccessTarget& target) const {
    switch (rule) {
        case AccessRule::RegistryOwner:
            if (isOwner(caller)) return std::nullopt;
            return RegistryError{ErrorKind::NotAuthorized, "Caller is not the registry owner."};

        case AccessRule::VerifiedMember:
            if (isVerifiedMember(caller)) return std::nullopt;
            return RegistryError{ErrorKind::NotVerified,
                                 "Caller has no membership in a verified institution."};

        case AccessRule::RecordAuthorOrInstitutionAdmin: {
            if (target.record && target.record->author == caller) return std::nullopt;
            auto membership = m_state.memberships.find(caller);
            if (membership != m_state.memberships.end() &&
                isInstitutionAdmin(caller, membership->second)) {
                return std::nullopt;
            }
            return RegistryError{ErrorKind::NotAuthorized,
                                 "Caller is neither the record author nor an institution admin."};
        }

        case AccessRule::InstitutionAdminOrOwner:
            if (isOwner(caller)) return std::nullopt;
            if (target.institutionId && isInstitutionAdmin(caller, *target.institutionId)) {
                return std::nullopt;
            }
            return RegistryError{ErrorKind::NotAuthorized,
                                 "Caller is neither the institution admin nor the registry owner."};
    }
    return RegistryError{ErrorKind::NotAuthorized, "Unknown access rule."};
}

} // namespace parasitereg::domain::registry
