/**
 * @file ResearcherDirectory.hpp
 * @brief Researcher -> institution membership relation.
 */

#pragma once

#include <optional>
#include <vector>

#include "AccessControl.hpp"
#include "RegistryError.hpp"
#include "RegistryState.hpp"
#include "SequenceClock.hpp"
#include "events/RegistryEvents.hpp"

namespace parasitereg::domain::registry {

class ResearcherDirectory {
public:
    ResearcherDirectory(RegistryState& state,
                        const AccessControl& access,
                        SequenceClock& clock,
                        std::vector<RegistryEvent>& pending);

    std::optional<InstitutionId> membershipOf(const Identity& researcher) const;

    /**
     * @brief Assigns (or reassigns) a researcher to an institution.
     *
     * Allowed for the target institution's admin or the registry owner.
     * Fails InvalidInstitution if the institution is unknown.
     */
    Result<Unit> setMembership(const Identity& researcher, const InstitutionId& institutionId, const Identity& caller);

    /**
     * @brief Removes a researcher's membership.
     *
     * Allowed for the admin of the researcher's current institution or the owner.
     * Fails InvalidInstitution if the researcher has no membership.
     */
    Result<Unit> revokeMembership(const Identity& researcher, const Identity& caller);

    void apply(const MembershipAssigned& e);
    void apply(const MembershipRevoked& e);

private:
    RegistryState& m_state;
    const AccessControl& m_access;
    SequenceClock& m_clock;
    std::vector<RegistryEvent>& m_pending;
};

} // namespace parasitereg::domain::registry
