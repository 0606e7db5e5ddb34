/**
 * @file RegistryJson.hpp
 * @brief JSON mapping of registry entities, shared by the event log and the outer surfaces.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/registry/RegistryError.hpp"
#include "domain/registry/entities/GeoStat.hpp"
#include "domain/registry/entities/Institution.hpp"
#include "domain/registry/entities/ParasiteRecord.hpp"

namespace parasitereg::infrastructure::registry {

nlohmann::json RecordToJson(const domain::registry::ParasiteRecord& record);

/** @throws std::runtime_error or nlohmann::json::exception on malformed input. */
domain::registry::ParasiteRecord RecordFromJson(const nlohmann::json& j);

nlohmann::json HistoryToJson(const std::vector<domain::registry::ParasiteRecord>& history);
nlohmann::json InstitutionToJson(const domain::registry::Institution& institution);
nlohmann::json GeoStatToJson(const domain::registry::GeoStat& stat);
nlohmann::json ErrorToJson(const domain::registry::RegistryError& error);

/** @throws std::runtime_error if j[key] is not a 40-char hex identity. */
domain::registry::Identity IdentityFromJson(const nlohmann::json& j, const char* key);

} // namespace parasitereg::infrastructure::registry
