#include "core/codec/ValueNormalizer.hpp"

#include "core/codec/BerCodec.hpp"
#include "core/types/SnmpErrors.hpp"

#include <algorithm>
#include <limits>

namespace snmpwire::core::codec {

namespace {

constexpr uint32_t UNIVERSAL_INTEGER = 2;
constexpr uint32_t UNIVERSAL_OCTET_STRING = 4;
constexpr uint32_t UNIVERSAL_OID = 6;

WireTag normalizedTag(WireTag tag) {
    if (tag.tagClass != TagClass::Application) {
        return tag;
    }
    switch (tag.tag) {
        case 0:
        case 4:
            return WireTag{TagClass::Universal, UNIVERSAL_OCTET_STRING};
        case 1:
        case 2:
        case 3:
        case 6:
            return WireTag{TagClass::Universal, UNIVERSAL_INTEGER};
        default:
            return tag;
    }
}

// Throws TypeMismatchError unless the normalized tag of the binding's value is
// universal @p expectedTag.
WireTag requireShape(const Binding& binding, uint32_t expectedTag, const char* expectedType) {
    auto tag = normalizedTag(wireTagOf(binding.value));
    if (std::holds_alternative<RawValue>(binding.value) || tag.tagClass != TagClass::Universal ||
        tag.tag != expectedTag) {
        throw TypeMismatchError(tag.tagClass, tag.tag, expectedType);
    }
    return tag;
}

// INTEGER-shaped alternatives widened to a signed/unsigned pair.
struct WideInteger {
    bool negative{false};
    uint64_t magnitude{0};
};

WideInteger widen(const Value& value) {
    if (auto* v = std::get_if<Integer>(&value)) {
        if (v->value < 0) {
            return {true, static_cast<uint64_t>(-(v->value + 1)) + 1};
        }
        return {false, static_cast<uint64_t>(v->value)};
    }
    if (auto* v = std::get_if<Counter32>(&value)) return {false, v->value};
    if (auto* v = std::get_if<Unsigned32>(&value)) return {false, v->value};
    if (auto* v = std::get_if<TimeTicks>(&value)) return {false, v->value};
    if (auto* v = std::get_if<Counter64>(&value)) return {false, v->value};
    throw DecodeError("Value is not an integer");
}

uint32_t narrowUnsigned32(uint64_t value, const char* what) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw DecodeError(std::string(what) + " out of range: " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

} // anonymous namespace

void normalizeClass(RawValue& raw) {
    if (raw.tagClass != TagClass::Application) {
        // Not a custom type.
        return;
    }

    uint8_t identifier = 0;
    switch (raw.tag) {
        case 0: // IpAddress ::= [APPLICATION 0] IMPLICIT OCTET STRING (SIZE (4))
        case 4: // Opaque ::= [APPLICATION 4] IMPLICIT OCTET STRING
            raw.tag = UNIVERSAL_OCTET_STRING;
            identifier = TAG_OCTET_STRING;
            break;
        case 1: // Counter32 ::= [APPLICATION 1] IMPLICIT INTEGER (0..4294967295)
        case 2: // Unsigned32 ::= [APPLICATION 2] IMPLICIT INTEGER (0..4294967295)
        case 3: // TimeTicks ::= [APPLICATION 3] IMPLICIT INTEGER (0..4294967295)
        case 6: // Counter64 ::= [APPLICATION 6] IMPLICIT INTEGER (0..18446744073709551615)
            raw.tag = UNIVERSAL_INTEGER;
            identifier = TAG_INTEGER;
            break;
        default:
            return;
    }

    raw.tagClass = TagClass::Universal;
    if (!raw.fullBytes.empty()) {
        raw.fullBytes[0] = identifier;
    }
}

Value decodeValue(const RawValue& raw) {
    // NULL and the exception values are identified by class and tag alone.
    if (raw.tagClass == TagClass::Universal && raw.tag == 5) {
        return Null{};
    }
    if (raw.tagClass == TagClass::ContextSpecific) {
        switch (raw.tag) {
            case 0: return NoSuchObject{};
            case 1: return NoSuchInstance{};
            case 2: return EndOfMibView{};
            default: break;
        }
    }
    if (raw.constructed) {
        return raw;
    }

    RawValue generic = raw;
    normalizeClass(generic);

    switch (raw.tagClass) {
        case TagClass::Universal:
            switch (raw.tag) {
                case 2: return Integer{decodeInteger(generic.content)};
                case 4: return OctetString{generic.content};
                case 6: return decodeOid(generic.content);
                default: return raw;
            }

        case TagClass::Application:
            switch (raw.tag) {
                case 0: {
                    if (generic.content.size() != 4) {
                        throw DecodeError("IpAddress must be 4 bytes, got " +
                                          std::to_string(generic.content.size()));
                    }
                    IpAddress ip;
                    std::copy(generic.content.begin(), generic.content.end(), ip.octets.begin());
                    return ip;
                }
                case 1:
                    return Counter32{narrowUnsigned32(decodeUnsigned(generic.content), "Counter32")};
                case 2:
                    return Unsigned32{
                        narrowUnsigned32(decodeUnsigned(generic.content), "Unsigned32")};
                case 3:
                    return TimeTicks{narrowUnsigned32(decodeUnsigned(generic.content), "TimeTicks")};
                case 4: return OctetString{generic.content};
                case 6: return Counter64{decodeUnsigned(generic.content)};
                default: return raw;
            }

        case TagClass::ContextSpecific:
        case TagClass::Private:
            break;
    }
    return raw;
}

std::vector<uint8_t> encodeValue(const Value& value) {
    if (std::holds_alternative<Null>(value)) return encodeNull();
    if (std::holds_alternative<NoSuchObject>(value)) return encodeNull(TAG_NO_SUCH_OBJECT);
    if (std::holds_alternative<NoSuchInstance>(value)) return encodeNull(TAG_NO_SUCH_INSTANCE);
    if (std::holds_alternative<EndOfMibView>(value)) return encodeNull(TAG_END_OF_MIB_VIEW);
    if (auto* v = std::get_if<Integer>(&value)) return encodeInteger(v->value);
    if (auto* v = std::get_if<OctetString>(&value)) return encodeOctetString(v->bytes);
    if (auto* v = std::get_if<ObjectIdentifier>(&value)) return encodeOid(*v);
    if (auto* v = std::get_if<IpAddress>(&value)) {
        return encodeOctetString(std::vector<uint8_t>(v->octets.begin(), v->octets.end()),
                                 TAG_IP_ADDRESS);
    }
    if (auto* v = std::get_if<Counter32>(&value)) return encodeUnsigned(v->value, TAG_COUNTER32);
    if (auto* v = std::get_if<Unsigned32>(&value)) return encodeUnsigned(v->value, TAG_UNSIGNED32);
    if (auto* v = std::get_if<TimeTicks>(&value)) return encodeUnsigned(v->value, TAG_TIMETICKS);
    if (auto* v = std::get_if<Counter64>(&value)) return encodeUnsigned(v->value, TAG_COUNTER64);

    const auto& raw = std::get<RawValue>(value);
    if (!raw.fullBytes.empty()) {
        return raw.fullBytes;
    }
    if (raw.tag >= 0x1F) {
        throw EncodeError("Cannot encode high tag number " + std::to_string(raw.tag));
    }
    return encodeTlv(identifierOctet(raw.tagClass, raw.constructed, raw.tag), raw.content);
}

template <>
int64_t decodeBindingValue<int64_t>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_INTEGER, "int64");
    auto wide = widen(binding.value);
    if (wide.negative) {
        return -static_cast<int64_t>(wide.magnitude - 1) - 1;
    }
    if (wide.magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw DecodeError("Integer out of range for int64: " + std::to_string(wide.magnitude));
    }
    return static_cast<int64_t>(wide.magnitude);
}

template <>
uint32_t decodeBindingValue<uint32_t>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_INTEGER, "uint32");
    auto wide = widen(binding.value);
    if (wide.negative) {
        throw DecodeError("Negative integer for uint32 in " + binding.name.toString());
    }
    return narrowUnsigned32(wide.magnitude, "Integer");
}

template <>
uint64_t decodeBindingValue<uint64_t>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_INTEGER, "uint64");
    auto wide = widen(binding.value);
    if (wide.negative) {
        throw DecodeError("Negative integer for uint64 in " + binding.name.toString());
    }
    return wide.magnitude;
}

template <>
std::vector<uint8_t> decodeBindingValue<std::vector<uint8_t>>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_OCTET_STRING, "bytes");
    if (auto* ip = std::get_if<IpAddress>(&binding.value)) {
        return std::vector<uint8_t>(ip->octets.begin(), ip->octets.end());
    }
    return std::get<OctetString>(binding.value).bytes;
}

template <>
std::string decodeBindingValue<std::string>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_OCTET_STRING, "string");
    if (auto* ip = std::get_if<IpAddress>(&binding.value)) {
        return std::string(ip->octets.begin(), ip->octets.end());
    }
    const auto& str = std::get<OctetString>(binding.value);
    if (auto text = str.text()) {
        return *text;
    }
    return std::string(str.bytes.begin(), str.bytes.end());
}

template <>
ObjectIdentifier decodeBindingValue<ObjectIdentifier>(const Binding& binding) {
    requireShape(binding, UNIVERSAL_OID, "ObjectIdentifier");
    return std::get<ObjectIdentifier>(binding.value);
}

std::optional<std::string> toPrintableString(const std::vector<uint8_t>& bytes) {
    return core::lengthPrefixedText(bytes);
}

std::optional<std::string> toPrintableString(const std::vector<uint32_t>& components) {
    return core::lengthPrefixedText(components);
}

} // namespace snmpwire::core::codec
