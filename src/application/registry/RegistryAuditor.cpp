/**
 * @file RegistryAuditor.cpp
 * @brief Implementation of RegistryAuditor.
 */

#include "application/registry/RegistryAuditor.hpp"

#include <map>

namespace parasitereg::application::registry {

using namespace parasitereg::domain::registry;

void RegistryAuditor::AddError(nlohmann::json& report, const std::string& message) const {
    report["errors"].push_back(message);
}

void RegistryAuditor::SetCheck(nlohmann::json& report, const std::string& key, bool ok) const {
    report["checks"][key] = ok ? "ok" : "error";
}

nlohmann::json RegistryAuditor::Audit(const RegistryState& state) const {
    nlohmann::json report = {
        {"status", "pass"},
        {"errors", nlohmann::json::array()},
        {"checks", nlohmann::json::object()},
        {"records", state.records.size()}
    };

    // A) Allocation: ids are 1..n with no gaps and the counter matches.
    bool allocationOk = state.lastRecordId == state.records.size();
    RecordId expected = 1;
    std::uint64_t lastRecordedAt = 0;
    for (const auto& [id, record] : state.records) {
        if (id != expected || record.id != id) {
            allocationOk = false;
            AddError(report, "Record id " + std::to_string(id) + " breaks the allocation sequence.");
            break;
        }
        if (record.recordedAt < lastRecordedAt) {
            allocationOk = false;
            AddError(report, "Record " + std::to_string(id) + " was recorded before its predecessor id.");
        }
        lastRecordedAt = record.recordedAt;
        ++expected;
    }
    if (state.lastRecordId != state.records.size()) {
        AddError(report, "Allocation counter " + std::to_string(state.lastRecordId) +
                         " differs from record count " + std::to_string(state.records.size()) + ".");
    }
    SetCheck(report, "allocation", allocationOk);

    // B) Version chains: version 1 iff no predecessor; otherwise predecessor exists,
    //    has a smaller id and exactly one version less.
    bool versionsOk = true;
    std::map<RecordId, int> successorCount;
    for (const auto& [id, record] : state.records) {
        if (!record.previousVersion) {
            if (record.version != 1) {
                versionsOk = false;
                AddError(report, "Record " + std::to_string(id) + " has no predecessor but version " +
                                 std::to_string(record.version) + ".");
            }
            continue;
        }
        const RecordId prevId = *record.previousVersion;
        auto prev = state.records.find(prevId);
        if (prev == state.records.end() || prevId >= id) {
            versionsOk = false;
            AddError(report, "Record " + std::to_string(id) + " points to invalid predecessor " +
                             std::to_string(prevId) + ".");
            continue;
        }
        if (record.version != prev->second.version + 1) {
            versionsOk = false;
            AddError(report, "Record " + std::to_string(id) + " version does not follow its predecessor.");
        }
        successorCount[prevId] += 1;
    }
    SetCheck(report, "versions", versionsOk);

    // C) Lineage heads: no forks, superseded versions archived, heads active.
    bool lineageOk = true;
    for (const auto& [id, record] : state.records) {
        auto it = successorCount.find(id);
        const int successors = (it == successorCount.end()) ? 0 : it->second;
        if (successors > 1) {
            lineageOk = false;
            AddError(report, "Record " + std::to_string(id) + " has " + std::to_string(successors) + " successors.");
        }
        if (successors > 0 && record.isActive()) {
            lineageOk = false;
            AddError(report, "Superseded record " + std::to_string(id) + " is still active.");
        }
        if (successors == 0 && !record.isActive()) {
            lineageOk = false;
            AddError(report, "Lineage head " + std::to_string(id) + " is archived.");
        }
    }
    SetCheck(report, "lineage", lineageOk);

    // D) Geographic totals equal the number of creates per region.
    bool geoOk = true;
    std::map<std::string, GeoStat> derived;
    for (const auto& [id, record] : state.records) {
        auto& stat = derived[record.location];
        stat.region = record.location;
        stat.totalCases += 1;
        if (record.recordedAt > stat.lastUpdated) stat.lastUpdated = record.recordedAt;
    }
    if (derived != state.geoStats) {
        geoOk = false;
        AddError(report, "Geographic stats do not match the record table.");
    }
    SetCheck(report, "geo_stats", geoOk);

    // E) Memberships point at registered institutions.
    bool membershipOk = true;
    for (const auto& [researcher, institutionId] : state.memberships) {
        if (state.institutions.count(institutionId) == 0) {
            membershipOk = false;
            AddError(report, "Researcher " + researcher.toHex() + " belongs to unknown institution " +
                             institutionId + ".");
        }
    }
    SetCheck(report, "memberships", membershipOk);

    if (!report["errors"].empty()) {
        report["status"] = "fail";
    }
    return report;
}

} // namespace parasitereg::application::registry
