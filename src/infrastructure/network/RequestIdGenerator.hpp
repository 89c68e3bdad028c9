#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace snmpwire::infra {

/**
 * @brief Source of unpredictable SNMP request identifiers.
 *
 * Ids are uniformly distributed over [0, INT32_MAX] so that an observer can
 * neither predict them nor infer when the process started. Safe for
 * concurrent use.
 *
 * @note This class is non-copyable. Use the singleton instance() for shared access.
 */
class RequestIdGenerator {
public:
    /**
     * @brief Constructs a generator seeded from std::random_device mixed with
     *        the high resolution clock.
     */
    RequestIdGenerator();

    /**
     * @brief Constructs a generator with a fixed seed (tests only).
     */
    explicit RequestIdGenerator(uint64_t seed);

    RequestIdGenerator(const RequestIdGenerator&) = delete;
    RequestIdGenerator& operator=(const RequestIdGenerator&) = delete;

    /**
     * @brief Draws the next identifier.
     */
    int32_t next();

    /**
     * @brief Returns the process-wide generator.
     */
    static RequestIdGenerator& instance();

private:
    std::mutex mutex_;
    std::mt19937 engine_;
    std::uniform_int_distribution<int32_t> distribution_;
};

} // namespace snmpwire::infra
