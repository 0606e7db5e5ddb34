/**
 * @file RegistryEvents.hpp
 * @brief Domain Events for every committed registry change.
 */

#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "../entities/Institution.hpp"
#include "../entities/ParasiteRecord.hpp"
#include "../value_objects/Identity.hpp"

namespace parasitereg::domain::registry {

struct RegistryInitialized {
    static constexpr const char* Type = "RegistryInitialized";
    Identity owner;
    std::uint64_t sequence = 0;
};

struct InstitutionRegistered {
    static constexpr const char* Type = "InstitutionRegistered";
    InstitutionId institutionId;
    std::string name;
    Identity admin;
    std::uint64_t sequence = 0;
};

struct InstitutionVerified {
    static constexpr const char* Type = "InstitutionVerified";
    InstitutionId institutionId;
    Identity verifiedBy;
    std::uint64_t sequence = 0;
};

struct InstitutionAdminChanged {
    static constexpr const char* Type = "InstitutionAdminChanged";
    InstitutionId institutionId;
    Identity newAdmin;
    Identity changedBy;
    std::uint64_t sequence = 0;
};

struct MembershipAssigned {
    static constexpr const char* Type = "MembershipAssigned";
    Identity researcher;
    InstitutionId institutionId;
    Identity assignedBy;
    std::uint64_t sequence = 0;
};

struct MembershipRevoked {
    static constexpr const char* Type = "MembershipRevoked";
    Identity researcher;
    Identity revokedBy;
    std::uint64_t sequence = 0;
};

// Emitted before the RecordCreated of the successor.
struct RecordArchived {
    static constexpr const char* Type = "RecordArchived";
    RecordId recordId = 0;
    Identity archivedBy;
    std::uint64_t sequence = 0;
};

struct RecordCreated {
    static constexpr const char* Type = "RecordCreated";
    ParasiteRecord record;  ///< record.recordedAt is the commit sequence.
};

// variant for generic handling
using RegistryEvent = std::variant<
    RegistryInitialized,
    InstitutionRegistered,
    InstitutionVerified,
    InstitutionAdminChanged,
    MembershipAssigned,
    MembershipRevoked,
    RecordArchived,
    RecordCreated
>;

/** @brief Commit sequence carried by any event. */
inline std::uint64_t EventSequence(const RegistryEvent& event) {
    return std::visit([](auto&& e) -> std::uint64_t {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RecordCreated>) {
            return e.record.recordedAt;
        } else {
            return e.sequence;
        }
    }, event);
}

} // namespace parasitereg::domain::registry
