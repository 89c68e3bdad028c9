#pragma once

#include "core/services/IDatagramChannel.hpp"
#include "core/services/IRoundTripper.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace snmpwire::infra {

/**
 * @brief SNMPv2c round tripper over a datagram channel (RFC 3416).
 *
 * Each call resets the request's binding values to Null, encodes and sends the
 * message, waits up to RECEIVE_TIMEOUT for one reply, and decodes it. There
 * are no retries.
 *
 * A transport serves one outstanding exchange at a time: the receive step
 * takes whatever datagram arrives next. Use one transport per thread.
 */
class SnmpTransport : public core::IRoundTripper {
public:
    /// Size of the receive buffer; a reply that fills it is rejected as truncated.
    static constexpr size_t RECEIVE_BUFFER_SIZE = 10000;

    /// Time allowed for the reply, measured from the start of the read.
    static constexpr std::chrono::seconds RECEIVE_TIMEOUT{5};

    /**
     * @brief Constructs a transport.
     * @param channel Connected channel to the agent.
     * @param community Community string sent with every request.
     */
    SnmpTransport(std::shared_ptr<core::IDatagramChannel> channel, std::string community);

    /**
     * @brief Executes one exchange.
     * @throws core::EncodeError, core::TransportError or core::DecodeError.
     */
    core::Response roundTrip(core::Request& request) override;

    [[nodiscard]] const std::string& community() const { return community_; }

private:
    std::shared_ptr<core::IDatagramChannel> channel_;
    std::string community_;
};

/**
 * @brief Connects a UDP channel to @p hostport and wraps it in a transport.
 * @param defaultPort Port used when @p hostport names none.
 * @throws core::TransportError if the agent address cannot be resolved.
 */
std::shared_ptr<SnmpTransport> makeUdpTransport(const std::string& hostport,
                                                const std::string& community,
                                                uint16_t defaultPort = 161);

} // namespace snmpwire::infra
