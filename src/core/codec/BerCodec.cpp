#include "core/codec/BerCodec.hpp"

#include "core/types/SnmpErrors.hpp"

#include <limits>

namespace snmpwire::core::codec {

namespace {

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

// Base-128 encoding of one sub-identifier, high bit set on all but the last byte.
void appendSubIdentifier(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t buf[10];
    size_t n = 0;
    do {
        buf[n++] = static_cast<uint8_t>(value & 0x7F);
        value >>= 7;
    } while (value > 0);

    while (n > 1) {
        out.push_back(static_cast<uint8_t>(buf[--n] | 0x80));
    }
    out.push_back(buf[0]);
}

} // anonymous namespace

// BER encoding helpers

std::vector<uint8_t> encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else if (length < 16777216) {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        throw EncodeError("Element too long: " + std::to_string(length) + " bytes");
    }

    return encoded;
}

std::vector<uint8_t> encodeTlv(uint8_t identifier, const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded;
    encoded.reserve(content.size() + 5);
    encoded.push_back(identifier);
    append(encoded, encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

std::vector<uint8_t> encodeInteger(int64_t value, uint8_t identifier) {
    std::vector<uint8_t> bytes(8);
    auto bits = static_cast<uint64_t>(value);
    for (int i = 7; i >= 0; --i) {
        bytes[static_cast<size_t>(i)] = static_cast<uint8_t>(bits & 0xFF);
        bits >>= 8;
    }

    // Strip redundant sign octets: two's complement, minimal length.
    size_t skip = 0;
    while (skip < 7) {
        uint8_t first = bytes[skip];
        bool nextHigh = (bytes[skip + 1] & 0x80) != 0;
        if ((first == 0x00 && !nextHigh) || (first == 0xFF && nextHigh)) {
            ++skip;
        } else {
            break;
        }
    }
    bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(skip));

    return encodeTlv(identifier, bytes);
}

std::vector<uint8_t> encodeUnsigned(uint64_t value, uint8_t identifier) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);

    // Add leading zero if high bit is set
    if (bytes[0] & 0x80) {
        bytes.insert(bytes.begin(), 0);
    }

    return encodeTlv(identifier, bytes);
}

std::vector<uint8_t> encodeOctetString(const std::vector<uint8_t>& bytes, uint8_t identifier) {
    return encodeTlv(identifier, bytes);
}

std::vector<uint8_t> encodeOctetString(const std::string& str) {
    return encodeTlv(TAG_OCTET_STRING, std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> encodeOid(const ObjectIdentifier& oid) {
    if (oid.size() < 2) {
        throw EncodeError("Object identifier needs at least two components: " + oid.toString());
    }
    if (oid[0] > 2 || (oid[0] < 2 && oid[1] >= 40)) {
        throw EncodeError("Invalid leading components in object identifier: " + oid.toString());
    }

    std::vector<uint8_t> content;
    // First two components are encoded as (first * 40 + second)
    appendSubIdentifier(content, static_cast<uint64_t>(oid[0]) * 40 + oid[1]);
    for (size_t i = 2; i < oid.size(); ++i) {
        appendSubIdentifier(content, oid[i]);
    }

    return encodeTlv(TAG_OID, content);
}

std::vector<uint8_t> encodeNull(uint8_t identifier) {
    return {identifier, 0x00};
}

std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content) {
    return encodeTlv(TAG_SEQUENCE, content);
}

// BER decoding helpers

int64_t decodeInteger(const std::vector<uint8_t>& content) {
    if (content.empty()) {
        throw DecodeError("Empty INTEGER");
    }
    if (content.size() > 8) {
        throw DecodeError("INTEGER too large: " + std::to_string(content.size()) + " bytes");
    }

    // Sign extend from the first octet
    uint64_t bits = (content[0] & 0x80) ? std::numeric_limits<uint64_t>::max() : 0;
    for (uint8_t b : content) {
        bits = (bits << 8) | b;
    }
    return static_cast<int64_t>(bits);
}

uint64_t decodeUnsigned(const std::vector<uint8_t>& content) {
    if (content.empty()) {
        throw DecodeError("Empty unsigned INTEGER");
    }

    size_t start = 0;
    while (start + 1 < content.size() && content[start] == 0x00) {
        ++start;
    }
    if (content.size() - start > 8) {
        throw DecodeError("Unsigned INTEGER too large: " + std::to_string(content.size()) +
                          " bytes");
    }

    uint64_t value = 0;
    for (size_t i = start; i < content.size(); ++i) {
        value = (value << 8) | content[i];
    }
    return value;
}

ObjectIdentifier decodeOid(const std::vector<uint8_t>& content) {
    if (content.empty()) {
        throw DecodeError("Empty OBJECT IDENTIFIER");
    }

    std::vector<uint32_t> components;
    uint64_t value = 0;
    bool inProgress = false;
    bool first = true;

    for (uint8_t b : content) {
        value = (value << 7) | (b & 0x7F);
        inProgress = true;
        if (value > std::numeric_limits<uint32_t>::max() + uint64_t{80}) {
            throw DecodeError("OBJECT IDENTIFIER component out of range");
        }
        if (b & 0x80) {
            continue;
        }

        if (first) {
            // First sub-identifier packs the first two components
            if (value < 80) {
                components.push_back(static_cast<uint32_t>(value / 40));
                components.push_back(static_cast<uint32_t>(value % 40));
            } else {
                components.push_back(2);
                components.push_back(static_cast<uint32_t>(value - 80));
            }
            first = false;
        } else {
            if (value > std::numeric_limits<uint32_t>::max()) {
                throw DecodeError("OBJECT IDENTIFIER component out of range");
            }
            components.push_back(static_cast<uint32_t>(value));
        }
        value = 0;
        inProgress = false;
    }

    if (inProgress) {
        throw DecodeError("Truncated OBJECT IDENTIFIER");
    }
    return ObjectIdentifier(std::move(components));
}

// BerReader

uint8_t BerReader::next(const char* what) {
    if (offset_ >= size_) {
        throw DecodeError(std::string("Unexpected end of data reading ") + what);
    }
    return data_[offset_++];
}

BerReader::Header BerReader::readHeader(const char* what) {
    Header header{};
    header.start = offset_;

    uint8_t id = next(what);
    header.tagClass = static_cast<TagClass>(id >> 6);
    header.constructed = (id & 0x20) != 0;
    header.tag = id & 0x1F;

    if (header.tag == 0x1F) {
        // High tag number form
        uint32_t tag = 0;
        uint8_t b = 0;
        size_t count = 0;
        do {
            b = next(what);
            if (++count > 4) {
                throw DecodeError(std::string("Tag number too large in ") + what);
            }
            tag = (tag << 7) | (b & 0x7F);
        } while (b & 0x80);
        header.tag = tag;
    }

    uint8_t first = next(what);
    if ((first & 0x80) == 0) {
        header.length = first;
    } else {
        size_t numBytes = first & 0x7F;
        if (numBytes == 0) {
            throw DecodeError(std::string("Indefinite length not allowed in ") + what);
        }
        if (numBytes > 4) {
            throw DecodeError(std::string("Length field too long in ") + what);
        }
        size_t length = 0;
        for (size_t i = 0; i < numBytes; ++i) {
            length = (length << 8) | next(what);
        }
        header.length = length;
    }

    if (header.length > remaining()) {
        throw DecodeError(std::string("Length exceeds available data in ") + what);
    }
    return header;
}

RawValue BerReader::readRaw() {
    auto header = readHeader("element");

    RawValue raw;
    raw.tagClass = header.tagClass;
    raw.tag = header.tag;
    raw.constructed = header.constructed;
    raw.content.assign(data_ + offset_, data_ + offset_ + header.length);
    offset_ += header.length;
    raw.fullBytes.assign(data_ + header.start, data_ + offset_);
    return raw;
}

RawValue BerReader::expect(TagClass tagClass, bool constructed, uint32_t tag, const char* what) {
    size_t start = offset_;
    auto raw = readRaw();
    if (raw.tagClass != tagClass || raw.constructed != constructed || raw.tag != tag) {
        offset_ = start;
        throw DecodeError(std::string("Unexpected tag for ") + what + ": class " +
                          std::to_string(static_cast<int>(raw.tagClass)) + " tag " +
                          std::to_string(raw.tag));
    }
    return raw;
}

int64_t BerReader::readInteger(const char* what) {
    return decodeInteger(expect(TagClass::Universal, false, 2, what).content);
}

std::vector<uint8_t> BerReader::readOctetString(const char* what) {
    return expect(TagClass::Universal, false, 4, what).content;
}

ObjectIdentifier BerReader::readOid(const char* what) {
    return decodeOid(expect(TagClass::Universal, false, 6, what).content);
}

BerReader BerReader::enter(TagClass tagClass, uint32_t tag, const char* what) {
    auto header = readHeader(what);
    if (header.tagClass != tagClass || !header.constructed || header.tag != tag) {
        throw DecodeError(std::string("Unexpected tag for ") + what + ": class " +
                          std::to_string(static_cast<int>(header.tagClass)) + " tag " +
                          std::to_string(header.tag));
    }
    BerReader inner(data_ + offset_, header.length);
    offset_ += header.length;
    return inner;
}

} // namespace snmpwire::core::codec
