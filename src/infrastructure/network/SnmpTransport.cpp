#include "infrastructure/network/SnmpTransport.hpp"

#include "core/codec/PduCodec.hpp"
#include "core/types/SnmpErrors.hpp"
#include "infrastructure/network/UdpChannel.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace snmpwire::infra {

SnmpTransport::SnmpTransport(std::shared_ptr<core::IDatagramChannel> channel,
                             std::string community)
    : channel_(std::move(channel)), community_(std::move(community)) {
    if (!channel_) {
        throw std::invalid_argument("SnmpTransport requires a channel");
    }
}

core::Response SnmpTransport::roundTrip(core::Request& request) {
    // Requests carry names only.
    for (auto& binding : request.bindings) {
        binding.value = core::Null{};
    }

    auto packet = core::codec::encodeRequest(request, community_);
    spdlog::debug("SNMP {} request {} with {} bindings ({} bytes)",
                  core::operationKindToString(request.kind), request.id,
                  request.bindings.size(), packet.size());

    if (auto ec = channel_->write(packet)) {
        throw core::TransportError("Send error: " + ec.message());
    }

    std::vector<uint8_t> recvBuffer(RECEIVE_BUFFER_SIZE);
    size_t bytesReceived = 0;
    auto deadline = core::IDatagramChannel::Clock::now() + RECEIVE_TIMEOUT;

    if (auto ec = channel_->read(recvBuffer, deadline, bytesReceived)) {
        if (ec == std::errc::timed_out) {
            throw core::TransportError("Request timed out");
        }
        throw core::TransportError("Receive error: " + ec.message());
    }
    if (bytesReceived == recvBuffer.size()) {
        throw core::TransportError("Response too big");
    }

    auto response = core::codec::decodeResponse(recvBuffer.data(), bytesReceived);
    spdlog::debug("SNMP response {} status {} index {} with {} bindings ({} bytes)",
                  response.id, response.errorStatus, response.errorIndex,
                  response.bindings.size(), bytesReceived);
    return response;
}

std::shared_ptr<SnmpTransport> makeUdpTransport(const std::string& hostport,
                                                const std::string& community,
                                                uint16_t defaultPort) {
    std::shared_ptr<UdpChannel> channel;
    try {
        channel = UdpChannel::connect(hostport, defaultPort);
    } catch (const std::invalid_argument& e) {
        throw core::TransportError(e.what());
    }
    return std::make_shared<SnmpTransport>(std::move(channel), community);
}

} // namespace snmpwire::infra
