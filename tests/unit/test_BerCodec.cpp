#include <catch2/catch_test_macros.hpp>

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/snmp/BerCodec.hpp"

using namespace snmplink::core;
using namespace snmplink::infra;

using Bytes = std::vector<uint8_t>;

TEST_CASE("BER length encoding", "[BerCodec]") {
    REQUIRE(BerCodec::encodeLength(0) == Bytes{0x00});
    REQUIRE(BerCodec::encodeLength(127) == Bytes{0x7F});
    REQUIRE(BerCodec::encodeLength(128) == Bytes{0x81, 0x80});
    REQUIRE(BerCodec::encodeLength(300) == Bytes{0x82, 0x01, 0x2C});
}

TEST_CASE("BER integer encoding is minimal two's complement", "[BerCodec]") {
    REQUIRE(BerCodec::encodeInteger(0) == Bytes{0x02, 0x01, 0x00});
    REQUIRE(BerCodec::encodeInteger(127) == Bytes{0x02, 0x01, 0x7F});
    REQUIRE(BerCodec::encodeInteger(128) == Bytes{0x02, 0x02, 0x00, 0x80});
    REQUIRE(BerCodec::encodeInteger(-1) == Bytes{0x02, 0x01, 0xFF});
    REQUIRE(BerCodec::encodeInteger(-128) == Bytes{0x02, 0x01, 0x80});
    REQUIRE(BerCodec::encodeInteger(-129) == Bytes{0x02, 0x02, 0xFF, 0x7F});
    REQUIRE(BerCodec::encodeInteger(INT32_MIN) == Bytes{0x02, 0x04, 0x80, 0x00, 0x00, 0x00});
}

TEST_CASE("BER unsigned encoding adds a leading zero for the high bit", "[BerCodec]") {
    REQUIRE(BerCodec::encodeUnsigned(200, TAG_GAUGE32) == Bytes{0x42, 0x02, 0x00, 0xC8});
    REQUIRE(BerCodec::encodeUnsigned(4294967295u, TAG_COUNTER32) ==
            Bytes{0x41, 0x05, 0x00, 0xFF, 0xFF, 0xFF, 0xFF});
    REQUIRE(BerCodec::encodeUnsigned(UINT64_MAX, TAG_COUNTER64).size() == 11);
}

TEST_CASE("BER OID encoding", "[BerCodec]") {
    SECTION("sysDescr.0") {
        auto encoded = BerCodec::encodeOid({1, 3, 6, 1, 2, 1, 1, 1, 0});
        REQUIRE(encoded == Bytes{0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00});
    }

    SECTION("Multi-byte sub-identifiers") {
        auto encoded = BerCodec::encodeOid({1, 3, 6, 1, 4, 1, 15000});
        REQUIRE(encoded == Bytes{0x06, 0x07, 0x2B, 0x06, 0x01, 0x04, 0x01, 0xF5, 0x18});
        REQUIRE(BerCodec::decodeOid(encoded.data() + 2, encoded.size() - 2) ==
                std::vector<uint32_t>{1, 3, 6, 1, 4, 1, 15000});
    }

    SECTION("Invalid first arcs are rejected") {
        REQUIRE_THROWS_AS(BerCodec::encodeOid({1}), FormatError);
        REQUIRE_THROWS_AS(BerCodec::encodeOid({3, 1}), FormatError);
        REQUIRE_THROWS_AS(BerCodec::encodeOid({1, 40}), FormatError);
    }

    SECTION("Joint-iso arc above 39") {
        auto encoded = BerCodec::encodeOid({2, 100, 3});
        REQUIRE(BerCodec::decodeOid(encoded.data() + 2, encoded.size() - 2) ==
                std::vector<uint32_t>{2, 100, 3});
    }

    SECTION("Truncated sub-identifier") {
        Bytes truncated{0x2B, 0x86};
        REQUIRE_THROWS_AS(BerCodec::decodeOid(truncated.data(), truncated.size()), FormatError);
    }
}

TEST_CASE("Value round trip per type", "[BerCodec]") {
    const std::vector<SnmpValue> values = {
        OctetString{"Test"},
        Integer{-5},
        Integer32{2147483647},
        Counter32{4294967295u},
        Counter64{18446744073709551615ull},
        Gauge32{200},
        Unsigned32{7},
        TimeTicks{8640000},
        IpAddress{{10, 0, 111, 112}},
        ObjectIdentifierValue{{1, 3, 6, 1, 4, 1, 15000}},
        Null{},
        NoSuchObject{},
        NoSuchInstance{},
        EndOfMibView{},
    };

    for (const auto& value : values) {
        auto encoded = BerCodec::encodeValue(value);
        CHECK(BerCodec::decodeValue(encoded, typeOf(value)) == value);
    }
}

TEST_CASE("Wire tags per type", "[BerCodec]") {
    REQUIRE(BerCodec::encodeValue(Integer32{1})[0] == TAG_INTEGER);
    REQUIRE(BerCodec::encodeValue(Unsigned32{1})[0] == TAG_GAUGE32);
    REQUIRE(BerCodec::encodeValue(Counter64{1})[0] == TAG_COUNTER64);
    REQUIRE(BerCodec::encodeValue(NoSuchInstance{}) == Bytes{TAG_NO_SUCH_INSTANCE, 0x00});
}

TEST_CASE("Decoding with and without an expected type", "[BerCodec]") {
    SECTION("Default alternatives for shared tags") {
        REQUIRE(BerCodec::decodeValue(BerCodec::encodeValue(Integer32{9})) == SnmpValue(Integer{9}));
        REQUIRE(BerCodec::decodeValue(BerCodec::encodeValue(Unsigned32{9})) ==
                SnmpValue(Gauge32{9}));
    }

    SECTION("Expected type selects the alternative") {
        auto encoded = BerCodec::encodeValue(Gauge32{9});
        REQUIRE(BerCodec::decodeValue(encoded, SnmpValueType::Unsigned32) ==
                SnmpValue(Unsigned32{9}));
    }

    SECTION("Tag mismatch is a format error") {
        auto encoded = BerCodec::encodeValue(Counter32{9});
        REQUIRE_THROWS_AS(BerCodec::decodeValue(encoded, SnmpValueType::Gauge32), FormatError);
    }

    SECTION("Exception values are accepted for any expected type") {
        auto encoded = BerCodec::encodeValue(NoSuchObject{});
        REQUIRE(BerCodec::decodeValue(encoded, SnmpValueType::Gauge32) == SnmpValue(NoSuchObject{}));
    }

    SECTION("Values wider than their type are rejected") {
        auto encoded = BerCodec::encodeUnsigned(4294967296ull, TAG_GAUGE32);
        REQUIRE_THROWS_AS(BerCodec::decodeValue(encoded), FormatError);
    }

    SECTION("Unknown tags are rejected") {
        REQUIRE_THROWS_AS(BerCodec::decodeValue(Bytes{0x44, 0x01, 0x00}), FormatError);
    }
}

TEST_CASE("BerReader bounds checks", "[BerCodec]") {
    SECTION("Length past the end of input") {
        Bytes data{0x04, 0x05, 'a', 'b'};
        BerReader reader(data);
        REQUIRE_THROWS_AS(reader.read(), FormatError);
    }

    SECTION("Missing length byte") {
        Bytes data{0x04};
        BerReader reader(data);
        REQUIRE_THROWS_AS(reader.read(), FormatError);
    }

    SECTION("Unexpected tag") {
        Bytes data{0x04, 0x00};
        BerReader reader(data);
        REQUIRE_THROWS_AS(reader.expect(TAG_INTEGER, "INTEGER"), FormatError);
    }

    SECTION("Long-form length") {
        Bytes data{0x04, 0x81, 0x02, 'o', 'k'};
        BerReader reader(data);
        auto tlv = reader.read();
        REQUIRE(tlv.length == 2);
        REQUIRE(reader.atEnd());
    }
}
