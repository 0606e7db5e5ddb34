/**
 * @file Institution.hpp
 * @brief Entity for a research institution allowed to contribute records.
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "../value_objects/Identity.hpp"

namespace parasitereg::domain::registry {

using InstitutionId = std::string;

struct InstitutionFieldLimits {
    static constexpr std::size_t Id = 50;
    static constexpr std::size_t Name = 100;
};

/**
 * @class Institution
 * @brief verified flips false -> true only, never back.
 */
class Institution {
public:
    Institution() = default;
    Institution(InstitutionId id, std::string name, Identity admin)
        : m_id(std::move(id)), m_name(std::move(name)), m_admin(admin) {}

    const InstitutionId& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    bool isVerified() const { return m_verified; }
    const Identity& getAdmin() const { return m_admin; }

    void markVerified() { m_verified = true; }
    void setAdmin(const Identity& admin) { m_admin = admin; }

    bool operator==(const Institution& other) const {
        return m_id == other.m_id && m_name == other.m_name &&
               m_verified == other.m_verified && m_admin == other.m_admin;
    }
    bool operator!=(const Institution& other) const { return !(*this == other); }

private:
    InstitutionId m_id;
    std::string m_name;
    bool m_verified = false;
    Identity m_admin;
};

} // namespace parasitereg::domain::registry
