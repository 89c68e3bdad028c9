#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "core/codec/PduCodec.hpp"
#include "core/types/SnmpErrors.hpp"
#include "infrastructure/network/SnmpTransport.hpp"
#include "support/TestDoubles.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace snmpwire::core;
using namespace snmpwire::infra;
using namespace snmpwire::test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Equals;

namespace {

const ObjectIdentifier kSysDescr{1, 3, 6, 1, 2, 1, 1, 1, 0};

Request getRequest(int32_t id) {
    Request request;
    request.id = id;
    request.kind = OperationKind::Get;
    request.bindings = makeRequestBindings({kSysDescr});
    return request;
}

std::vector<uint8_t> encodedReply(int32_t id) {
    Response response;
    response.id = id;
    response.bindings = {Binding{kSysDescr, OctetString{{'L', 'i', 'n', 'u', 'x'}}}};
    return codec::encodeResponse(response, "public");
}

} // namespace

TEST_CASE("SnmpTransport construction", "[SnmpTransport]") {
    REQUIRE_THROWS_AS(SnmpTransport(nullptr, "public"), std::invalid_argument);

    SnmpTransport transport(std::make_shared<ScriptedChannel>(), "private");
    REQUIRE(transport.community() == "private");
}

TEST_CASE("SnmpTransport round trip", "[SnmpTransport]") {
    auto channel = std::make_shared<ScriptedChannel>();
    SnmpTransport transport(channel, "public");

    SECTION("Sends one datagram and decodes the reply") {
        channel->replies.push_back({encodedReply(9), {}, false});

        auto request = getRequest(9);
        auto response = transport.roundTrip(request);

        REQUIRE(channel->written.size() == 1);
        REQUIRE(channel->written[0] == codec::encodeRequest(request, "public"));
        REQUIRE(response.id == 9);
        REQUIRE(response.bindings.size() == 1);
        REQUIRE(response.bindings[0].value == Value{OctetString{{'L', 'i', 'n', 'u', 'x'}}});
    }

    SECTION("Request values are reset to Null before sending") {
        channel->replies.push_back({encodedReply(3), {}, false});

        auto request = getRequest(3);
        request.bindings[0].value = Integer{99};
        transport.roundTrip(request);

        REQUIRE(std::holds_alternative<Null>(request.bindings[0].value));
        auto sent = codec::decodeRequest(channel->written[0]);
        REQUIRE(std::holds_alternative<Null>(sent.request.bindings[0].value));
    }

    SECTION("The reply is not validated") {
        channel->replies.push_back({encodedReply(1000), {}, false});

        auto request = getRequest(1);
        REQUIRE(transport.roundTrip(request).id == 1000);
    }

    SECTION("Waits up to the receive timeout") {
        channel->replies.push_back({encodedReply(1), {}, false});

        auto before = IDatagramChannel::Clock::now();
        auto request = getRequest(1);
        transport.roundTrip(request);

        REQUIRE(channel->lastDeadline >= before + SnmpTransport::RECEIVE_TIMEOUT);
        REQUIRE(channel->lastDeadline <=
                IDatagramChannel::Clock::now() + SnmpTransport::RECEIVE_TIMEOUT);
    }
}

TEST_CASE("SnmpTransport failures", "[SnmpTransport]") {
    auto channel = std::make_shared<ScriptedChannel>();
    SnmpTransport transport(channel, "public");
    auto request = getRequest(1);

    SECTION("Send failure") {
        channel->writeError = std::make_error_code(std::errc::network_unreachable);
        REQUIRE_THROWS_WITH(transport.roundTrip(request), ContainsSubstring("Send error"));
    }

    SECTION("Timeout") {
        REQUIRE_THROWS_AS(transport.roundTrip(request), TransportError);
        REQUIRE_THROWS_WITH(transport.roundTrip(request), Equals("Request timed out"));
    }

    SECTION("Receive failure") {
        channel->replies.push_back({{}, std::make_error_code(std::errc::connection_refused), false});
        REQUIRE_THROWS_WITH(transport.roundTrip(request), ContainsSubstring("Receive error"));
    }

    SECTION("Reply filling the whole buffer") {
        channel->replies.push_back({{}, {}, true});
        REQUIRE_THROWS_WITH(transport.roundTrip(request), Equals("Response too big"));
    }

    SECTION("Garbage reply") {
        channel->replies.push_back({{0x04, 0x02, 'h', 'i'}, {}, false});
        REQUIRE_THROWS_AS(transport.roundTrip(request), DecodeError);
    }

    SECTION("Unknown operation kind") {
        request.kind = static_cast<OperationKind>(7);
        REQUIRE_THROWS_AS(transport.roundTrip(request), EncodeError);
        REQUIRE(channel->written.empty());
    }
}

TEST_CASE("makeUdpTransport", "[SnmpTransport]") {
    REQUIRE_THROWS_AS(makeUdpTransport("", "public"), TransportError);
    REQUIRE_THROWS_AS(makeUdpTransport("127.0.0.1:notaport", "public"), TransportError);

    auto transport = makeUdpTransport("127.0.0.1:16100", "secret");
    REQUIRE(transport->community() == "secret");
}
