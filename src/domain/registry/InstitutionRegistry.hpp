/**
 * @file InstitutionRegistry.hpp
 * @brief Institution records and their verification state.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "AccessControl.hpp"
#include "RegistryError.hpp"
#include "RegistryState.hpp"
#include "SequenceClock.hpp"
#include "events/RegistryEvents.hpp"

namespace parasitereg::domain::registry {

class InstitutionRegistry {
public:
    InstitutionRegistry(RegistryState& state,
                        const AccessControl& access,
                        SequenceClock& clock,
                        std::vector<RegistryEvent>& pending);

    /**
     * @brief Owner-only. The new institution starts unverified with the caller as admin.
     *
     * Re-registering an existing id is rejected with InvalidInstitution.
     */
    Result<Unit> registerInstitution(const InstitutionId& id, const std::string& name, const Identity& caller);

    /** @brief Owner-only. Verifying an already verified institution succeeds without a change. */
    Result<Unit> verifyInstitution(const InstitutionId& id, const Identity& caller);

    /**
     * @brief Hands the institution's admin role to another identity.
     *
     * Allowed for the current admin or the owner. Fails InvalidInstitution if unknown.
     */
    Result<Unit> transferAdmin(const InstitutionId& id, const Identity& newAdmin, const Identity& caller);

    std::optional<Institution> getInstitution(const InstitutionId& id) const;

    void apply(const InstitutionRegistered& e);
    void apply(const InstitutionVerified& e);
    void apply(const InstitutionAdminChanged& e);

private:
    RegistryState& m_state;
    const AccessControl& m_access;
    SequenceClock& m_clock;
    std::vector<RegistryEvent>& m_pending;
};

} // namespace parasitereg::domain::registry
