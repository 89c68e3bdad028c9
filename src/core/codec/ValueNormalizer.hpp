/**
 * @file ValueNormalizer.hpp
 * @brief Conversion of SNMP application-class values to generic BER values.
 *
 * SNMP defines its own scalar types (Counter32, TimeTicks, IpAddress, ...) as
 * IMPLICIT application-class tags over INTEGER and OCTET STRING. The functions
 * here map those tags back to the universal ones so the generic BER decoders
 * can read the payload, and build the typed Value from the result.
 */

#pragma once

#include "core/types/Binding.hpp"
#include "core/types/SnmpValue.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmpwire::core::codec {

/**
 * @brief Rewrites an application-class value to its universal equivalent.
 *
 * - application 0, 4 (IpAddress, Opaque) become universal OCTET STRING;
 * - application 1, 2, 3, 6 (Counter32, Unsigned32, TimeTicks, Counter64)
 *   become universal INTEGER.
 *
 * The identifier octet in @c fullBytes is patched to match. Any other
 * class/tag is left unchanged, so normalizing twice is a no-op.
 */
void normalizeClass(RawValue& raw);

/**
 * @brief Builds the typed Value for one binding's raw value.
 *
 * The alternative is picked from the class/tag on the wire; the payload is
 * read by the generic INTEGER / OCTET STRING / OID decoders after
 * normalization. Unknown tags are kept as RawValue.
 *
 * @throws DecodeError if the payload is malformed for its tag.
 */
Value decodeValue(const RawValue& raw);

/**
 * @brief Encodes @p value with its SNMP tag. Inverse of decodeValue.
 */
std::vector<uint8_t> encodeValue(const Value& value);

/**
 * @brief Extracts a binding's value as @p T.
 *
 * Supported targets: int64_t, uint32_t, uint64_t (any INTEGER-shaped value),
 * std::string and std::vector<uint8_t> (OCTET STRING-shaped values) and
 * ObjectIdentifier. For std::string the printable text is returned when
 * OctetString::text() finds one, the bytes verbatim otherwise.
 *
 * @throws TypeMismatchError when the normalized class/tag cannot hold a @p T.
 * @throws DecodeError when an integer does not fit in @p T.
 */
template <typename T>
T decodeBindingValue(const Binding& binding);

template <>
int64_t decodeBindingValue<int64_t>(const Binding& binding);
template <>
uint32_t decodeBindingValue<uint32_t>(const Binding& binding);
template <>
uint64_t decodeBindingValue<uint64_t>(const Binding& binding);
template <>
std::string decodeBindingValue<std::string>(const Binding& binding);
template <>
std::vector<uint8_t> decodeBindingValue<std::vector<uint8_t>>(const Binding& binding);
template <>
ObjectIdentifier decodeBindingValue<ObjectIdentifier>(const Binding& binding);

/**
 * @brief Interprets a length-prefixed byte string as printable ASCII.
 *
 * The first byte must equal the number of remaining bytes, and every remaining
 * byte must lie in [0x20, 0x7e]. This is a heuristic for display strings; it
 * can misclassify binary data and must not be used to round-trip arbitrary
 * octets.
 *
 * @return The text after the length byte, std::nullopt if the check fails.
 */
std::optional<std::string> toPrintableString(const std::vector<uint8_t>& bytes);

/**
 * @brief Same heuristic over integer components, e.g. an OID index suffix
 *        that encodes a string as "len.c1.c2...".
 */
std::optional<std::string> toPrintableString(const std::vector<uint32_t>& components);

} // namespace snmpwire::core::codec
