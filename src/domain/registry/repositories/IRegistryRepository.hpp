/**
 * @file IRegistryRepository.hpp
 * @brief Interface for persisting the registry's event stream.
 */

#pragma once

#include <memory>

#include "../ParasiteRegistry.hpp"
#include "../SequenceClock.hpp"

namespace parasitereg::domain::registry {

class IRegistryRepository {
public:
    virtual ~IRegistryRepository() = default;

    // Save a brand new registry (creates the stream)
    virtual void save(ParasiteRegistry& registry) = 0;

    // Rebuild the registry from storage; nullptr when no stream exists yet
    virtual std::unique_ptr<ParasiteRegistry> load(SequenceClock& clock) = 0;

    // Append the registry's uncommitted events and clear them
    virtual void update(ParasiteRegistry& registry) = 0;

    // Block until every accepted write has reached storage
    virtual void flush() = 0;
};

} // namespace parasitereg::domain::registry
