/**
 * @file LogicalClock.hpp
 * @brief Counter-based SequenceClock for standalone deployments.
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "domain/registry/SequenceClock.hpp"

namespace parasitereg::infrastructure {

class LogicalClock : public domain::registry::SequenceClock {
public:
    explicit LogicalClock(std::uint64_t start = 0) : m_value(start) {}

    std::uint64_t advance() override {
        return m_value.fetch_add(1) + 1;
    }

    std::uint64_t current() const override {
        return m_value.load();
    }

    void observe(std::uint64_t value) override {
        std::uint64_t seen = m_value.load();
        while (seen < value && !m_value.compare_exchange_weak(seen, value)) {
        }
    }

private:
    std::atomic<std::uint64_t> m_value;
};

} // namespace parasitereg::infrastructure
