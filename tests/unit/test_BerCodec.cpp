#include <catch2/catch_test_macros.hpp>

#include "core/codec/BerCodec.hpp"
#include "core/types/SnmpErrors.hpp"

#include <vector>

using namespace snmpwire::core;
using namespace snmpwire::core::codec;

using Bytes = std::vector<uint8_t>;

TEST_CASE("BER length encoding", "[BerCodec]") {
    REQUIRE(encodeLength(0) == Bytes{0x00});
    REQUIRE(encodeLength(127) == Bytes{0x7F});
    REQUIRE(encodeLength(128) == Bytes{0x81, 0x80});
    REQUIRE(encodeLength(255) == Bytes{0x81, 0xFF});
    REQUIRE(encodeLength(256) == Bytes{0x82, 0x01, 0x00});
    REQUIRE(encodeLength(70000) == Bytes{0x83, 0x01, 0x11, 0x70});
    REQUIRE_THROWS_AS(encodeLength(16777216), EncodeError);
}

TEST_CASE("BER integer encoding", "[BerCodec]") {
    SECTION("Minimal two's complement") {
        REQUIRE(encodeInteger(0) == Bytes{0x02, 0x01, 0x00});
        REQUIRE(encodeInteger(127) == Bytes{0x02, 0x01, 0x7F});
        REQUIRE(encodeInteger(128) == Bytes{0x02, 0x02, 0x00, 0x80});
        REQUIRE(encodeInteger(256) == Bytes{0x02, 0x02, 0x01, 0x00});
        REQUIRE(encodeInteger(-1) == Bytes{0x02, 0x01, 0xFF});
        REQUIRE(encodeInteger(-128) == Bytes{0x02, 0x01, 0x80});
        REQUIRE(encodeInteger(-129) == Bytes{0x02, 0x02, 0xFF, 0x7F});
    }

    SECTION("Decoding sign-extends") {
        REQUIRE(decodeInteger({0x7F}) == 127);
        REQUIRE(decodeInteger({0x00, 0x80}) == 128);
        REQUIRE(decodeInteger({0xFF}) == -1);
        REQUIRE(decodeInteger({0xFF, 0x7F}) == -129);
        REQUIRE(decodeInteger({0x80, 0, 0, 0, 0, 0, 0, 0}) == INT64_MIN);
    }

    SECTION("Decoding rejects empty and oversized content") {
        REQUIRE_THROWS_AS(decodeInteger({}), DecodeError);
        REQUIRE_THROWS_AS(decodeInteger(Bytes(9, 0x01)), DecodeError);
    }

    SECTION("Every encoding decodes to its value") {
        for (int64_t value : {int64_t{0}, int64_t{1}, int64_t{-1}, int64_t{65535},
                              int64_t{-65536}, INT64_MAX, INT64_MIN}) {
            auto encoded = encodeInteger(value);
            Bytes content(encoded.begin() + 2, encoded.end());
            REQUIRE(decodeInteger(content) == value);
        }
    }
}

TEST_CASE("BER unsigned encoding", "[BerCodec]") {
    REQUIRE(encodeUnsigned(0, TAG_COUNTER32) == Bytes{0x41, 0x01, 0x00});
    REQUIRE(encodeUnsigned(255, TAG_COUNTER32) == Bytes{0x41, 0x02, 0x00, 0xFF});
    REQUIRE(encodeUnsigned(4294967295u, TAG_UNSIGNED32) ==
            Bytes{0x42, 0x05, 0x00, 0xFF, 0xFF, 0xFF, 0xFF});

    REQUIRE(decodeUnsigned({0x00, 0xFF, 0xFF, 0xFF, 0xFF}) == 4294967295u);
    REQUIRE(decodeUnsigned({0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}) ==
            UINT64_MAX);
    REQUIRE(decodeUnsigned({0x80}) == 128);
    REQUIRE_THROWS_AS(decodeUnsigned({}), DecodeError);
    REQUIRE_THROWS_AS(decodeUnsigned(Bytes(9, 0x01)), DecodeError);
}

TEST_CASE("BER OID encoding", "[BerCodec]") {
    SECTION("Packs the first two components") {
        REQUIRE(encodeOid(ObjectIdentifier{1, 3, 6, 1}) == Bytes{0x06, 0x03, 0x2B, 0x06, 0x01});
    }

    SECTION("Multi-byte sub-identifiers") {
        REQUIRE(encodeOid(ObjectIdentifier{1, 3, 6, 1, 4, 1, 2021}) ==
                Bytes{0x06, 0x07, 0x2B, 0x06, 0x01, 0x04, 0x01, 0x8F, 0x65});
    }

    SECTION("Rejects short or invalid identifiers") {
        REQUIRE_THROWS_AS(encodeOid(ObjectIdentifier{1}), EncodeError);
        REQUIRE_THROWS_AS(encodeOid(ObjectIdentifier{3, 1}), EncodeError);
        REQUIRE_THROWS_AS(encodeOid(ObjectIdentifier{1, 40}), EncodeError);
    }

    SECTION("Decoding") {
        REQUIRE(decodeOid({0x2B, 0x06, 0x01, 0x04, 0x01, 0x8F, 0x65}) ==
                ObjectIdentifier{1, 3, 6, 1, 4, 1, 2021});
        REQUIRE(decodeOid({0x88, 0x37, 0x01}) == ObjectIdentifier{2, 999, 1});
        REQUIRE(decodeOid({0x8F, 0xFF, 0xFF, 0xFF, 0x7F, 0x00}).toString() ==
                "2.4294967215.0");
    }

    SECTION("Decoding rejects truncated and overflowing content") {
        REQUIRE_THROWS_AS(decodeOid({}), DecodeError);
        REQUIRE_THROWS_AS(decodeOid({0x2B, 0x86}), DecodeError);
        REQUIRE_THROWS_AS(decodeOid({0x2B, 0x90, 0x80, 0x80, 0x80, 0x00}), DecodeError);
    }
}

TEST_CASE("BerReader", "[BerCodec]") {
    SECTION("Reads nested elements") {
        Bytes data{0x30, 0x06, 0x02, 0x01, 0x05, 0x04, 0x01, 'a'};
        BerReader reader(data);
        auto seq = reader.enter(TagClass::Universal, 0x10, "sequence");

        REQUIRE(reader.atEnd());
        REQUIRE(seq.readInteger("number") == 5);
        REQUIRE(seq.readOctetString("text") == Bytes{'a'});
        REQUIRE(seq.atEnd());
    }

    SECTION("readRaw keeps header and content") {
        Bytes data{0x41, 0x02, 0x01, 0x00};
        BerReader reader(data);
        auto raw = reader.readRaw();

        REQUIRE(raw.tagClass == TagClass::Application);
        REQUIRE(raw.tag == 1);
        REQUIRE_FALSE(raw.constructed);
        REQUIRE(raw.content == Bytes{0x01, 0x00});
        REQUIRE(raw.fullBytes == data);
    }

    SECTION("Long form lengths") {
        Bytes data{0x04, 0x81, 0x80};
        data.insert(data.end(), 128, 'x');
        BerReader reader(data);
        REQUIRE(reader.readOctetString("text").size() == 128);
    }

    SECTION("High tag numbers") {
        Bytes data{0x5F, 0x81, 0x00, 0x00};
        BerReader reader(data);
        auto raw = reader.readRaw();
        REQUIRE(raw.tagClass == TagClass::Application);
        REQUIRE(raw.tag == 128);
    }

    SECTION("Malformed input throws") {
        Bytes truncated{0x04, 0x05, 'a'};
        REQUIRE_THROWS_AS(BerReader(truncated).readRaw(), DecodeError);

        Bytes indefinite{0x30, 0x80, 0x00, 0x00};
        REQUIRE_THROWS_AS(BerReader(indefinite).readRaw(), DecodeError);

        Bytes empty;
        REQUIRE_THROWS_AS(BerReader(empty).readRaw(), DecodeError);

        Bytes wrongTag{0x04, 0x01, 0x00};
        REQUIRE_THROWS_AS(BerReader(wrongTag).readInteger("number"), DecodeError);

        Bytes primitive{0x10, 0x00};
        REQUIRE_THROWS_AS(BerReader(primitive).enter(TagClass::Universal, 0x10, "sequence"),
                          DecodeError);
    }
}
