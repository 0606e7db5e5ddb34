/**
 * @file RegistryAuditor.hpp
 * @brief Re-verifies the ledger invariants over a full registry snapshot.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/registry/RegistryState.hpp"

namespace parasitereg::application::registry {

/**
 * @class RegistryAuditor
 * @brief Produces a pass/fail report for the whole store.
 *
 * Checks id allocation, version chains, lineage heads, geographic totals
 * and membership references.
 */
class RegistryAuditor {
public:
    nlohmann::json Audit(const domain::registry::RegistryState& state) const;

private:
    void AddError(nlohmann::json& report, const std::string& message) const;
    void SetCheck(nlohmann::json& report, const std::string& key, bool ok) const;
};

} // namespace parasitereg::application::registry
