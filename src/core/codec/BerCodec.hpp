#pragma once

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpValue.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace snmpwire::core::codec {

/** @name Identifier octets used by SNMPv2c
 *  @{ */
constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_UNSIGNED32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_OPAQUE = 0x44;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;
/** @} */

/**
 * @brief Builds a single identifier octet. Only low tag numbers (< 31) fit.
 */
constexpr uint8_t identifierOctet(TagClass tagClass, bool constructed, uint32_t tag) {
    return static_cast<uint8_t>((static_cast<uint8_t>(tagClass) << 6) |
                                (constructed ? 0x20 : 0x00) | (tag & 0x1F));
}

// BER encoding helpers. Definite lengths only.
std::vector<uint8_t> encodeLength(size_t length);
std::vector<uint8_t> encodeTlv(uint8_t identifier, const std::vector<uint8_t>& content);
std::vector<uint8_t> encodeInteger(int64_t value, uint8_t identifier = TAG_INTEGER);
std::vector<uint8_t> encodeUnsigned(uint64_t value, uint8_t identifier);
std::vector<uint8_t> encodeOctetString(const std::vector<uint8_t>& bytes,
                                       uint8_t identifier = TAG_OCTET_STRING);
std::vector<uint8_t> encodeOctetString(const std::string& str);
std::vector<uint8_t> encodeOid(const ObjectIdentifier& oid);
std::vector<uint8_t> encodeNull(uint8_t identifier = TAG_NULL);
std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content);

// Content-octet decoders. All throw DecodeError on malformed input.
int64_t decodeInteger(const std::vector<uint8_t>& content);
uint64_t decodeUnsigned(const std::vector<uint8_t>& content);
ObjectIdentifier decodeOid(const std::vector<uint8_t>& content);

/**
 * @brief Bounds-checked cursor over a BER encoded buffer.
 *
 * The buffer must outlive the reader. Every read that would run past the end
 * of the buffer throws DecodeError instead.
 */
class BerReader {
public:
    BerReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit BerReader(const std::vector<uint8_t>& data) : BerReader(data.data(), data.size()) {}

    [[nodiscard]] bool atEnd() const { return offset_ >= size_; }
    [[nodiscard]] size_t remaining() const { return size_ - offset_; }

    /**
     * @brief Reads the next element of any class and tag.
     */
    RawValue readRaw();

    /**
     * @brief Reads the next element and checks its class, form and tag.
     * @param what Field name used in the error message.
     */
    RawValue expect(TagClass tagClass, bool constructed, uint32_t tag, const char* what);

    int64_t readInteger(const char* what);
    std::vector<uint8_t> readOctetString(const char* what);
    ObjectIdentifier readOid(const char* what);

    /**
     * @brief Reads a constructed element and returns a reader over its content.
     */
    BerReader enter(TagClass tagClass, uint32_t tag, const char* what);

private:
    struct Header {
        TagClass tagClass;
        bool constructed;
        uint32_t tag;
        size_t start;   // offset of the identifier octet
        size_t length;  // content length
    };

    Header readHeader(const char* what);
    uint8_t next(const char* what);

    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

} // namespace snmpwire::core::codec
