#include "core/codec/PduCodec.hpp"

#include "core/codec/BerCodec.hpp"
#include "core/codec/ValueNormalizer.hpp"
#include "core/types/SnmpErrors.hpp"

#include <limits>

namespace snmpwire::core::codec {

namespace {

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> encodeBindingList(const std::vector<Binding>& bindings) {
    std::vector<uint8_t> varbindList;
    for (const auto& binding : bindings) {
        std::vector<uint8_t> varbind;
        append(varbind, encodeOid(binding.name));
        append(varbind, encodeValue(binding.value));
        append(varbindList, encodeSequence(varbind));
    }
    return encodeSequence(varbindList);
}

std::vector<Binding> decodeBindingList(BerReader& pdu) {
    std::vector<Binding> bindings;
    auto list = pdu.enter(TagClass::Universal, 0x10, "varbind-list");

    while (!list.atEnd()) {
        auto varbind = list.enter(TagClass::Universal, 0x10, "varbind");
        Binding binding;
        binding.name = varbind.readOid("name");
        binding.value = decodeValue(varbind.readRaw());
        if (!varbind.atEnd()) {
            throw DecodeError("Trailing data in varbind " + binding.name.toString());
        }
        bindings.push_back(std::move(binding));
    }
    return bindings;
}

int32_t toInt32(int64_t value, const char* what) {
    if (value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        throw DecodeError(std::string(what) + " out of range: " + std::to_string(value));
    }
    return static_cast<int32_t>(value);
}

std::vector<uint8_t> encodeMessage(const std::string& community, uint32_t pduTag,
                                   const std::vector<uint8_t>& pduContent) {
    std::vector<uint8_t> msgContent;
    append(msgContent, encodeInteger(SNMP_VERSION_2C));
    append(msgContent, encodeOctetString(community));
    append(msgContent, encodeTlv(identifierOctet(TagClass::ContextSpecific, true, pduTag),
                                 pduContent));
    return encodeSequence(msgContent);
}

} // anonymous namespace

uint32_t pduTagFor(OperationKind kind) {
    switch (kind) {
        case OperationKind::Get: return 0;
        case OperationKind::GetNext: return 1;
        case OperationKind::GetBulk: return 5;
    }
    throw EncodeError("Unsupported operation kind " + std::to_string(static_cast<int>(kind)));
}

std::vector<uint8_t> encodeRequest(const Request& request, const std::string& community) {
    const uint32_t tag = pduTagFor(request.kind);

    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(request.id));
    if (request.kind == OperationKind::GetBulk) {
        append(pduContent, encodeInteger(request.nonRepeaters));
        append(pduContent, encodeInteger(request.maxRepetitions));
    } else {
        append(pduContent, encodeInteger(0)); // error-status
        append(pduContent, encodeInteger(0)); // error-index
    }
    append(pduContent, encodeBindingList(request.bindings));

    return encodeMessage(community, tag, pduContent);
}

Response decodeResponse(const uint8_t* data, size_t size) {
    BerReader reader(data, size);
    auto message = reader.enter(TagClass::Universal, 0x10, "message");

    auto version = message.readInteger("version");
    if (version != SNMP_VERSION_2C) {
        throw DecodeError("Unsupported SNMP version " + std::to_string(version));
    }
    message.readOctetString("community");

    auto pdu = message.enter(TagClass::ContextSpecific, RESPONSE_PDU_TAG, "response PDU");

    Response response;
    response.id = toInt32(pdu.readInteger("request-id"), "request-id");
    response.errorStatus = toInt32(pdu.readInteger("error-status"), "error-status");
    response.errorIndex = toInt32(pdu.readInteger("error-index"), "error-index");
    response.bindings = decodeBindingList(pdu);

    return response;
}

Response decodeResponse(const std::vector<uint8_t>& data) {
    return decodeResponse(data.data(), data.size());
}

RequestMessage decodeRequest(const std::vector<uint8_t>& data) {
    BerReader reader(data);
    auto message = reader.enter(TagClass::Universal, 0x10, "message");

    RequestMessage result;
    result.version = toInt32(message.readInteger("version"), "version");
    auto community = message.readOctetString("community");
    result.community.assign(community.begin(), community.end());

    auto pduRaw = message.readRaw();
    if (pduRaw.tagClass != TagClass::ContextSpecific || !pduRaw.constructed) {
        throw DecodeError("Expected a request PDU");
    }

    auto& request = result.request;
    switch (pduRaw.tag) {
        case 0: request.kind = OperationKind::Get; break;
        case 1: request.kind = OperationKind::GetNext; break;
        case 5: request.kind = OperationKind::GetBulk; break;
        default:
            throw DecodeError("Unsupported request PDU tag " + std::to_string(pduRaw.tag));
    }

    BerReader pdu(pduRaw.content);
    request.id = toInt32(pdu.readInteger("request-id"), "request-id");
    auto second = toInt32(pdu.readInteger("non-repeaters"), "non-repeaters");
    auto third = toInt32(pdu.readInteger("max-repetitions"), "max-repetitions");
    if (request.kind == OperationKind::GetBulk) {
        request.nonRepeaters = second;
        request.maxRepetitions = third;
    }
    request.bindings = decodeBindingList(pdu);

    return result;
}

std::vector<uint8_t> encodeResponse(const Response& response, const std::string& community) {
    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(response.id));
    append(pduContent, encodeInteger(response.errorStatus));
    append(pduContent, encodeInteger(response.errorIndex));
    append(pduContent, encodeBindingList(response.bindings));

    return encodeMessage(community, RESPONSE_PDU_TAG, pduContent);
}

} // namespace snmpwire::core::codec
