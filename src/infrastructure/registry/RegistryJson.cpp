/**
 * @file RegistryJson.cpp
 * @brief Implementation of the registry JSON mapping.
 */

#include "infrastructure/registry/RegistryJson.hpp"

#include <stdexcept>

namespace parasitereg::infrastructure::registry {

using json = nlohmann::json;
using namespace parasitereg::domain::registry;

Identity IdentityFromJson(const json& j, const char* key) {
    auto parsed = Identity::fromHex(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::runtime_error(std::string("Invalid identity in field '") + key + "'");
    }
    return *parsed;
}

json RecordToJson(const ParasiteRecord& r) {
    json j = {
        {"id", r.id},
        {"parasiteName", r.parasiteName},
        {"classification", r.classification},
        {"location", r.location},
        {"recordedAt", r.recordedAt},
        {"author", r.author.toHex()},
        {"metadataHash", r.metadataHash.toHex()},
        {"status", RecordStatusToString(r.status)},
        {"version", r.version}
    };
    j["previousVersion"] = r.previousVersion ? json(*r.previousVersion) : json(nullptr);
    return j;
}

ParasiteRecord RecordFromJson(const json& j) {
    ParasiteRecord r;
    r.id = j.at("id").get<RecordId>();
    r.parasiteName = j.at("parasiteName").get<std::string>();
    r.classification = j.at("classification").get<std::string>();
    r.location = j.at("location").get<std::string>();
    r.recordedAt = j.at("recordedAt").get<std::uint64_t>();
    r.author = IdentityFromJson(j, "author");

    auto digest = MetadataDigest::fromHex(j.at("metadataHash").get<std::string>());
    if (!digest) throw std::runtime_error("Invalid metadataHash in record " + std::to_string(r.id));
    r.metadataHash = *digest;

    auto status = RecordStatusFromString(j.at("status").get<std::string>());
    if (!status) throw std::runtime_error("Invalid status in record " + std::to_string(r.id));
    r.status = *status;

    r.version = j.at("version").get<std::uint64_t>();
    if (j.contains("previousVersion") && !j["previousVersion"].is_null()) {
        r.previousVersion = j["previousVersion"].get<RecordId>();
    }
    return r;
}

json HistoryToJson(const std::vector<ParasiteRecord>& history) {
    json arr = json::array();
    for (const auto& record : history) {
        arr.push_back(RecordToJson(record));
    }
    return arr;
}

json InstitutionToJson(const Institution& institution) {
    return {
        {"id", institution.getId()},
        {"name", institution.getName()},
        {"verified", institution.isVerified()},
        {"admin", institution.getAdmin().toHex()}
    };
}

json GeoStatToJson(const GeoStat& stat) {
    return {
        {"region", stat.region},
        {"totalCases", stat.totalCases},
        {"lastUpdated", stat.lastUpdated}
    };
}

json ErrorToJson(const RegistryError& error) {
    return {
        {"error", ErrorKindToString(error.kind)},
        {"message", error.message}
    };
}

} // namespace parasitereg::infrastructure::registry
