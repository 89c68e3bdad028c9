#include "core/types/SnmpValue.hpp"

#include <iomanip>
#include <sstream>

namespace snmpwire::core {

namespace {

bool isPrintable(uint8_t c) {
    return c >= 0x20 && c <= 0x7e;
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

template <typename Element>
std::optional<std::string> prefixedText(const std::vector<Element>& x) {
    if (x.empty() || static_cast<uint64_t>(x[0]) != x.size() - 1) {
        return std::nullopt;
    }

    std::string text;
    text.reserve(x.size() - 1);
    for (size_t i = 1; i < x.size(); ++i) {
        if (x[i] < 0x20 || x[i] > 0x7e) {
            return std::nullopt;
        }
        text.push_back(static_cast<char>(x[i]));
    }
    return text;
}

// Overload set for std::visit.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

std::optional<std::string> lengthPrefixedText(const std::vector<uint8_t>& bytes) {
    return prefixedText(bytes);
}

std::optional<std::string> lengthPrefixedText(const std::vector<uint32_t>& components) {
    return prefixedText(components);
}

std::optional<std::string> OctetString::text() const {
    if (auto prefixed = lengthPrefixedText(bytes)) {
        return prefixed;
    }
    for (uint8_t c : bytes) {
        if (!isPrintable(c)) {
            return std::nullopt;
        }
    }
    return std::string(bytes.begin(), bytes.end());
}

std::string IpAddress::toString() const {
    return std::to_string(octets[0]) + "." + std::to_string(octets[1]) + "." +
           std::to_string(octets[2]) + "." + std::to_string(octets[3]);
}

WireTag wireTagOf(const Value& value) {
    return std::visit(
        Overloaded{
            [](const Null&) { return WireTag{TagClass::Universal, 5}; },
            [](const NoSuchObject&) { return WireTag{TagClass::ContextSpecific, 0}; },
            [](const NoSuchInstance&) { return WireTag{TagClass::ContextSpecific, 1}; },
            [](const EndOfMibView&) { return WireTag{TagClass::ContextSpecific, 2}; },
            [](const Integer&) { return WireTag{TagClass::Universal, 2}; },
            [](const OctetString&) { return WireTag{TagClass::Universal, 4}; },
            [](const ObjectIdentifier&) { return WireTag{TagClass::Universal, 6}; },
            [](const IpAddress&) { return WireTag{TagClass::Application, 0}; },
            [](const Counter32&) { return WireTag{TagClass::Application, 1}; },
            [](const Unsigned32&) { return WireTag{TagClass::Application, 2}; },
            [](const TimeTicks&) { return WireTag{TagClass::Application, 3}; },
            [](const Counter64&) { return WireTag{TagClass::Application, 6}; },
            [](const RawValue& raw) { return WireTag{raw.tagClass, raw.tag}; },
        },
        value);
}

SnmpDataType dataTypeOf(const Value& value) {
    return std::visit(
        Overloaded{
            [](const Null&) { return SnmpDataType::Null; },
            [](const NoSuchObject&) { return SnmpDataType::NoSuchObject; },
            [](const NoSuchInstance&) { return SnmpDataType::NoSuchInstance; },
            [](const EndOfMibView&) { return SnmpDataType::EndOfMibView; },
            [](const Integer&) { return SnmpDataType::Integer; },
            [](const OctetString&) { return SnmpDataType::OctetString; },
            [](const ObjectIdentifier&) { return SnmpDataType::ObjectIdentifier; },
            [](const IpAddress&) { return SnmpDataType::IpAddress; },
            [](const Counter32&) { return SnmpDataType::Counter32; },
            [](const Unsigned32&) { return SnmpDataType::Unsigned32; },
            [](const TimeTicks&) { return SnmpDataType::TimeTicks; },
            [](const Counter64&) { return SnmpDataType::Counter64; },
            [](const RawValue&) { return SnmpDataType::Unknown; },
        },
        value);
}

std::string snmpDataTypeToString(SnmpDataType type) {
    switch (type) {
        case SnmpDataType::Integer: return "INTEGER";
        case SnmpDataType::OctetString: return "OCTET STRING";
        case SnmpDataType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpDataType::IpAddress: return "IpAddress";
        case SnmpDataType::Counter32: return "Counter32";
        case SnmpDataType::Unsigned32: return "Unsigned32";
        case SnmpDataType::TimeTicks: return "TimeTicks";
        case SnmpDataType::Counter64: return "Counter64";
        case SnmpDataType::Null: return "Null";
        case SnmpDataType::NoSuchObject: return "noSuchObject";
        case SnmpDataType::NoSuchInstance: return "noSuchInstance";
        case SnmpDataType::EndOfMibView: return "endOfMibView";
        case SnmpDataType::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string valueToString(const Value& value) {
    return std::visit(
        Overloaded{
            [](const Null&) -> std::string { return ""; },
            [](const NoSuchObject&) -> std::string { return "No Such Object"; },
            [](const NoSuchInstance&) -> std::string { return "No Such Instance"; },
            [](const EndOfMibView&) -> std::string { return "End of MIB View"; },
            [](const Integer& v) { return std::to_string(v.value); },
            [](const OctetString& v) {
                auto text = v.text();
                return text ? *text : toHex(v.bytes);
            },
            [](const ObjectIdentifier& v) { return v.toString(); },
            [](const IpAddress& v) { return v.toString(); },
            [](const Counter32& v) { return std::to_string(v.value); },
            [](const Unsigned32& v) { return std::to_string(v.value); },
            [](const TimeTicks& v) { return std::to_string(v.value); },
            [](const Counter64& v) { return std::to_string(v.value); },
            [](const RawValue& v) { return toHex(v.content); },
        },
        value);
}

bool isExceptionValue(const Value& value) {
    return std::holds_alternative<Null>(value) || std::holds_alternative<NoSuchObject>(value) ||
           std::holds_alternative<NoSuchInstance>(value) ||
           std::holds_alternative<EndOfMibView>(value);
}

} // namespace snmpwire::core
