#include "infrastructure/network/UdpChannel.hpp"

#include "core/types/SnmpErrors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace snmpwire::infra {

UdpChannel::UdpChannel(const std::string& host, uint16_t port) : socket_(ioContext_) {
    asio::error_code ec;
    asio::ip::udp::resolver resolver(ioContext_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);

    if (ec || endpoints.empty()) {
        throw core::TransportError("Failed to resolve address " + host + ": " +
                                   (ec ? ec.message() : std::string("no results")));
    }

    remote_ = asio::connect(socket_, endpoints, ec);
    if (ec) {
        throw core::TransportError("Failed to connect to " + host + ":" + std::to_string(port) +
                                   ": " + ec.message());
    }

    spdlog::debug("UDP channel connected to {}:{}", remote_.address().to_string(),
                  remote_.port());
}

UdpChannel::~UdpChannel() {
    asio::error_code ec;
    socket_.close(ec);
}

std::shared_ptr<UdpChannel> UdpChannel::connect(const std::string& hostport,
                                                uint16_t defaultPort) {
    auto [host, port] = splitHostPort(hostport, defaultPort);
    return std::make_shared<UdpChannel>(host, port);
}

std::error_code UdpChannel::write(const std::vector<uint8_t>& datagram) {
    asio::error_code ec;
    size_t sent = socket_.send(asio::buffer(datagram), 0, ec);
    if (ec) {
        return ec;
    }
    if (sent != datagram.size()) {
        return std::make_error_code(std::errc::message_size);
    }
    return {};
}

std::error_code UdpChannel::read(std::vector<uint8_t>& buffer,
                                 Clock::time_point deadline,
                                 size_t& bytesRead) {
    bytesRead = 0;

    asio::error_code result;
    size_t received = 0;
    bool completed = false;

    socket_.async_receive(asio::buffer(buffer),
                          [&](const asio::error_code& ec, size_t length) {
                              result = ec;
                              received = length;
                              completed = true;
                          });

    ioContext_.restart();
    ioContext_.run_until(deadline);

    if (!completed) {
        // Deadline passed: abort the receive and let its handler run.
        asio::error_code ignored;
        socket_.cancel(ignored);
        ioContext_.restart();
        ioContext_.run();
        return std::make_error_code(std::errc::timed_out);
    }

    bytesRead = received;
    return result;
}

std::pair<std::string, uint16_t> splitHostPort(const std::string& hostport, uint16_t defaultPort) {
    std::string host;
    std::string port;
    bool hasPort = false;

    if (!hostport.empty() && hostport.front() == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 literal: " + hostport);
        }
        host = hostport.substr(1, close - 1);
        if (close + 1 < hostport.size()) {
            if (hostport[close + 1] != ':') {
                throw std::invalid_argument("Malformed address: " + hostport);
            }
            port = hostport.substr(close + 2);
            hasPort = true;
        }
    } else {
        auto colon = hostport.find(':');
        if (colon != std::string::npos && hostport.find(':', colon + 1) == std::string::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            hasPort = true;
        } else {
            host = hostport;
        }
    }

    if (host.empty()) {
        throw std::invalid_argument("Missing host in address: " + hostport);
    }
    if (!hasPort) {
        return {host, defaultPort};
    }

    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(port, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port in address: " + hostport);
    }
    if (consumed != port.size() || value == 0 || value > 65535) {
        throw std::invalid_argument("Invalid port in address: " + hostport);
    }
    return {host, static_cast<uint16_t>(value)};
}

} // namespace snmpwire::infra
