#pragma once

#include "core/services/IDatagramChannel.hpp"

#include <asio.hpp>
#include <memory>
#include <string>
#include <utility>

namespace snmpwire::infra {

/**
 * @brief Connected UDP socket to one SNMP agent, built on Asio.
 *
 * Owns a private io_context that is only run from within read(), so the
 * channel needs no worker threads. Implements core::IDatagramChannel.
 *
 * @note This class is non-copyable. One exchange at a time.
 */
class UdpChannel : public core::IDatagramChannel {
public:
    static constexpr uint16_t DEFAULT_PORT = 161;

    /**
     * @brief Resolves @p host and connects a UDP socket to it.
     * @param host Hostname or IP address.
     * @param port Agent port.
     * @throws core::TransportError if resolution or connecting fails.
     */
    UdpChannel(const std::string& host, uint16_t port);

    ~UdpChannel() override;

    UdpChannel(const UdpChannel&) = delete;
    UdpChannel& operator=(const UdpChannel&) = delete;

    /**
     * @brief Creates a channel from "host", "host:port" or "[v6addr]:port".
     *
     * The port defaults to @p defaultPort when not given.
     */
    static std::shared_ptr<UdpChannel> connect(const std::string& hostport,
                                               uint16_t defaultPort = DEFAULT_PORT);

    std::error_code write(const std::vector<uint8_t>& datagram) override;

    std::error_code read(std::vector<uint8_t>& buffer,
                         Clock::time_point deadline,
                         size_t& bytesRead) override;

    /**
     * @brief Returns the address the socket is connected to.
     */
    asio::ip::udp::endpoint remoteEndpoint() const { return remote_; }

private:
    asio::io_context ioContext_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint remote_;
};

/**
 * @brief Splits "host[:port]" into its parts.
 *
 * Bracketed IPv6 literals ("[::1]:1161") are supported; a bare IPv6 literal
 * is taken as a host without port.
 *
 * @throws std::invalid_argument on an empty host or a malformed port.
 */
std::pair<std::string, uint16_t> splitHostPort(const std::string& hostport, uint16_t defaultPort);

} // namespace snmpwire::infra
