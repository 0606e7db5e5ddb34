/**
 * @file AccessControl.hpp
 * @brief Authorization predicates shared by every registry component.
 */

#pragma once

#include <optional>

#include "RegistryError.hpp"
#include "RegistryState.hpp"

namespace parasitereg::domain::registry {

/**
 * @enum AccessRule
 * @brief The authorization rules a mutation can be gated on.
 */
enum class AccessRule {
    RegistryOwner,                  ///< Caller is the registry owner.
    VerifiedMember,                 ///< Caller belongs to a verified institution.
    RecordAuthorOrInstitutionAdmin, ///< Caller wrote the record, or administers its own institution.
    InstitutionAdminOrOwner         ///< Caller administers the target institution, or is the owner.
};

/** @brief What a rule is evaluated against. Unused members stay null. */
struct AccessTarget {
    const ParasiteRecord* record = nullptr;
    const InstitutionId* institutionId = nullptr;
};

/**
 * @class AccessControl
 * @brief Stateless view over RegistryState answering "may this caller do that?".
 *
 * Every command evaluates its rule before touching state.
 */
class AccessControl {
public:
    explicit AccessControl(const RegistryState& state) : m_state(state) {}

    bool isOwner(const Identity& caller) const;
    bool isInstitutionAdmin(const Identity& caller, const InstitutionId& institutionId) const;
    bool isVerifiedMember(const Identity& caller) const;

    /**
     * @brief Evaluates a rule.
     * @return The rejection to report, or nullopt when the caller is allowed.
     */
    std::optional<RegistryError> authorize(AccessRule rule,
                                           const Identity& caller,
                                           const AccessTarget& target = {}) const;

private:
    const RegistryState& m_state;
};

} // namespace parasitereg::domain::registry
