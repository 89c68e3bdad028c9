/**
 * @file SnmpValue.hpp
 * @brief Values carried in SNMP variable bindings.
 *
 * This file defines the closed set of value alternatives an SNMPv2c agent can
 * return in a binding, the raw tag-length-value form they arrive in, and the
 * helpers used to classify and print them.
 */

#pragma once

#include "core/types/ObjectIdentifier.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace snmpwire::core {

/**
 * @brief BER tag classes (bits 8-7 of the identifier octet).
 */
enum class TagClass : uint8_t {
    Universal = 0,       ///< Types defined by X.680 (INTEGER, OCTET STRING, ...)
    Application = 1,     ///< SNMP application types (Counter32, IpAddress, ...)
    ContextSpecific = 2, ///< PDU tags and the v2c exception values
    Private = 3          ///< Unused by SNMP
};

/**
 * @brief A single BER element exactly as it was read from the wire.
 *
 * @c fullBytes holds identifier, length and content octets; @c content holds
 * only the content octets.
 */
struct RawValue {
    TagClass tagClass{TagClass::Universal}; ///< Class bits of the identifier
    uint32_t tag{0};                        ///< Tag number
    bool constructed{false};                ///< Constructed (true) or primitive encoding
    std::vector<uint8_t> content;           ///< Content octets
    std::vector<uint8_t> fullBytes;         ///< Complete encoding including the header

    bool operator==(const RawValue& other) const = default;
};

/** @name Exception and placeholder values
 *  @{ */
struct Null {
    bool operator==(const Null&) const = default;
};
struct NoSuchObject {
    bool operator==(const NoSuchObject&) const = default;
};
struct NoSuchInstance {
    bool operator==(const NoSuchInstance&) const = default;
};
struct EndOfMibView {
    bool operator==(const EndOfMibView&) const = default;
};
/** @} */

struct Integer {
    int64_t value{0};
    bool operator==(const Integer&) const = default;
};

/**
 * @brief Reads "len.c1.c2..." as text: the first element must equal the
 *        number of remaining elements, each of which is printable ASCII.
 * @return The text after the length, std::nullopt if the check fails.
 */
std::optional<std::string> lengthPrefixedText(const std::vector<uint8_t>& bytes);
std::optional<std::string> lengthPrefixedText(const std::vector<uint32_t>& components);

/**
 * @brief Arbitrary octet string, possibly human-readable text.
 */
struct OctetString {
    std::vector<uint8_t> bytes;

    /**
     * @brief Best-effort text view of the bytes.
     *
     * Tries the length-prefixed printable heuristic first, then accepts the
     * bytes verbatim when they are all printable ASCII. This is a heuristic:
     * binary strings that happen to be printable are reported as text.
     *
     * @return Text when the bytes look printable, std::nullopt otherwise.
     */
    [[nodiscard]] std::optional<std::string> text() const;

    bool operator==(const OctetString&) const = default;
};

struct IpAddress {
    std::array<uint8_t, 4> octets{};

    [[nodiscard]] std::string toString() const;
    bool operator==(const IpAddress&) const = default;
};

struct Counter32 {
    uint32_t value{0};
    bool operator==(const Counter32&) const = default;
};

/// Unsigned32 and Gauge32 share application tag 2.
struct Unsigned32 {
    uint32_t value{0};
    bool operator==(const Unsigned32&) const = default;
};

/// Hundredths of a second.
struct TimeTicks {
    uint32_t value{0};
    bool operator==(const TimeTicks&) const = default;
};

struct Counter64 {
    uint64_t value{0};
    bool operator==(const Counter64&) const = default;
};

/**
 * @brief Decoded value of one variable binding.
 *
 * Exactly one alternative is active. The alternative is chosen from the
 * (class, tag) pair seen on the wire; unknown pairs are kept as RawValue.
 */
using Value = std::variant<Null,
                           NoSuchObject,
                           NoSuchInstance,
                           EndOfMibView,
                           Integer,
                           OctetString,
                           ObjectIdentifier,
                           IpAddress,
                           Counter32,
                           Unsigned32,
                           TimeTicks,
                           Counter64,
                           RawValue>;

/**
 * @brief SNMP data types as defined in RFC 2578 and RFC 3416.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Unsigned32 = 5,       ///< 32-bit unsigned value (Gauge32)
    TimeTicks = 6,        ///< Hundredths of a second since epoch
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Unknown = 99          ///< Any other tag
};

/**
 * @brief Class and tag of the wire encoding that produces @p value.
 */
struct WireTag {
    TagClass tagClass{TagClass::Universal};
    uint32_t tag{0};

    bool operator==(const WireTag& other) const = default;
};

/**
 * @brief Returns the wire class/tag for the active alternative of @p value.
 */
WireTag wireTagOf(const Value& value);

/**
 * @brief Returns the data type classification of @p value.
 */
SnmpDataType dataTypeOf(const Value& value);

/**
 * @brief Converts an SNMP data type to its string representation.
 * @param type The data type to convert.
 * @return String representation (e.g., "INTEGER", "OCTET STRING").
 */
std::string snmpDataTypeToString(SnmpDataType type);

/**
 * @brief Renders @p value for display, e.g. "42", "eth0", "10.0.0.1".
 *
 * Octet strings that are not printable are shown as colon-separated hex.
 */
std::string valueToString(const Value& value);

/**
 * @brief True when @p value holds one of the placeholder or exception
 *        alternatives (Null, NoSuchObject, NoSuchInstance, EndOfMibView).
 */
bool isExceptionValue(const Value& value);

} // namespace snmpwire::core
