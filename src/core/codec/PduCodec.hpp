#pragma once

#include "core/types/SnmpPdu.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace snmpwire::core::codec {

/// msgVersion value for SNMPv2c.
constexpr int32_t SNMP_VERSION_2C = 1;

/// Context tag of the Response-PDU.
constexpr uint32_t RESPONSE_PDU_TAG = 2;

/**
 * @brief Returns the context tag used for @p kind's request PDU.
 * @throws EncodeError for a value outside OperationKind.
 */
uint32_t pduTagFor(OperationKind kind);

/**
 * @brief Encodes a request message.
 *
 * Produces SEQUENCE { version 1, community, PDU } where the PDU is
 * [0] / [1] { requestID, 0, 0, bindings } for Get / GetNext and
 * [5] { requestID, nonRepeaters, maxRepetitions, bindings } for GetBulk.
 * Binding values are encoded as they are; the transport resets them to Null
 * first.
 *
 * @throws EncodeError on an unknown operation kind or an unencodable name.
 */
std::vector<uint8_t> encodeRequest(const Request& request, const std::string& community);

/**
 * @brief Decodes a Response-PDU message.
 *
 * Every binding value is normalized and decoded into its Value alternative.
 *
 * @throws DecodeError when the bytes are not a well-formed v2c response.
 */
Response decodeResponse(const uint8_t* data, size_t size);
Response decodeResponse(const std::vector<uint8_t>& data);

/**
 * @brief A request message as seen by an agent.
 */
struct RequestMessage {
    int32_t version{SNMP_VERSION_2C};
    std::string community;
    Request request;
};

/**
 * @brief Decodes a request message (agent side, used by test agents).
 * @throws DecodeError when the bytes are not a Get, GetNext or GetBulk message.
 */
RequestMessage decodeRequest(const std::vector<uint8_t>& data);

/**
 * @brief Encodes a Response-PDU message (agent side, used by test agents).
 */
std::vector<uint8_t> encodeResponse(const Response& response, const std::string& community);

} // namespace snmpwire::core::codec
