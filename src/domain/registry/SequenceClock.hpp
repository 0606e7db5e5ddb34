/**
 * @file SequenceClock.hpp
 * @brief Monotonic commit clock supplied by the hosting environment.
 */

#pragma once

#include <cstdint>

namespace parasitereg::domain::registry {

/**
 * @class SequenceClock
 * @brief Source of strictly increasing commit sequence values.
 */
class SequenceClock {
public:
    virtual ~SequenceClock() = default;

    /** @brief Returns a value strictly greater than any value returned before. */
    virtual std::uint64_t advance() = 0;

    /** @brief Last value handed out (0 before the first advance). */
    virtual std::uint64_t current() const = 0;

    /** @brief Moves the clock forward so that current() >= value. Never moves it back. */
    virtual void observe(std::uint64_t value) = 0;
};

} // namespace parasitereg::domain::registry
