/**
 * @file IDatagramChannel.hpp
 * @brief Interface for the byte-oriented channel a transport talks through.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <system_error>
#include <vector>

namespace snmpwire::core {

/**
 * @brief Connected, message-oriented duplex channel to one SNMP agent.
 *
 * Implementations are not required to be thread safe; one exchange at a time.
 */
class IDatagramChannel {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~IDatagramChannel() = default;

    /**
     * @brief Sends one datagram.
     * @param datagram The complete encoded message.
     * @return Empty error code on success.
     */
    virtual std::error_code write(const std::vector<uint8_t>& datagram) = 0;

    /**
     * @brief Receives one datagram into @p buffer, waiting until @p deadline.
     * @param buffer Destination; its size is the maximum accepted length.
     * @param deadline Point in time after which the read fails with timed_out.
     * @param bytesRead Set to the number of bytes written into @p buffer.
     * @return Empty error code on success.
     */
    virtual std::error_code read(std::vector<uint8_t>& buffer,
                                 Clock::time_point deadline,
                                 size_t& bytesRead) = 0;
};

} // namespace snmpwire::core
