/**
 * @file ParasiteRecord.hpp
 * @brief Entity for one immutable version of a parasite observation.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../value_objects/Identity.hpp"
#include "../value_objects/MetadataDigest.hpp"

namespace parasitereg::domain::registry {

using RecordId = std::uint64_t;

/**
 * @enum RecordStatus
 * @brief Active -> Archived is the only transition, and it is one-way.
 */
enum class RecordStatus {
    Active,
    Archived
};

inline std::string RecordStatusToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Active: return "active";
        case RecordStatus::Archived: return "archived";
        default: return "unknown";
    }
}

inline std::optional<RecordStatus> RecordStatusFromString(const std::string& str) {
    if (str == "active") return RecordStatus::Active;
    if (str == "archived") return RecordStatus::Archived;
    return std::nullopt;
}

/** @brief Maximum field lengths accepted on submission, in Unicode code points. */
struct RecordFieldLimits {
    static constexpr std::size_t ParasiteName = 100;
    static constexpr std::size_t Classification = 50;
    static constexpr std::size_t Location = 100;
};

/**
 * @struct ParasiteRecord
 * @brief A single version within a lineage.
 *
 * Invariants: version == 1 iff previousVersion is empty; otherwise
 * previousVersion < id and version == predecessor.version + 1.
 */
struct ParasiteRecord {
    RecordId id = 0;
    std::string parasiteName;
    std::string classification;
    std::string location;
    std::uint64_t recordedAt = 0;   ///< Sequence value at commit.
    Identity author;
    MetadataDigest metadataHash;
    RecordStatus status = RecordStatus::Active;
    std::uint64_t version = 1;
    std::optional<RecordId> previousVersion;

    bool isActive() const { return status == RecordStatus::Active; }

    bool operator==(const ParasiteRecord& other) const {
        return id == other.id &&
               parasiteName == other.parasiteName &&
               classification == other.classification &&
               location == other.location &&
               recordedAt == other.recordedAt &&
               author == other.author &&
               metadataHash == other.metadataHash &&
               status == other.status &&
               version == other.version &&
               previousVersion == other.previousVersion;
    }
    bool operator!=(const ParasiteRecord& other) const { return !(*this == other); }
};

} // namespace parasitereg::domain::registry
