#include <catch2/catch_test_macros.hpp>

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/snmp/BerCodec.hpp"
#include "infrastructure/snmp/SnmpMessage.hpp"

using namespace snmplink::core;
using namespace snmplink::infra;

namespace {

SnmpMessage makeGetRequest() {
    SnmpMessage message;
    message.version = SnmpVersion::V2c;
    message.community = "private";
    message.pdu.type = PduType::GetRequest;
    message.pdu.requestId = 0x1234;
    message.pdu.varbinds.push_back(
        VarBind{ObjectIdentifier::fromString(SnmpOids::SYS_DESCR), Null{}});
    return message;
}

} // namespace

TEST_CASE("GetRequest wire layout", "[SnmpMessage]") {
    auto encoded = encodeMessage(makeGetRequest());

    const std::vector<uint8_t> expected = {
        0x30, 0x28,                                     // SEQUENCE
        0x02, 0x01, 0x01,                               // version 2c
        0x04, 0x07, 'p', 'r', 'i', 'v', 'a', 't', 'e', // community
        0xA0, 0x1A,                                     // GetRequest PDU
        0x02, 0x02, 0x12, 0x34,                         // request-id
        0x02, 0x01, 0x00,                               // error-status
        0x02, 0x01, 0x00,                               // error-index
        0x30, 0x0E,                                     // varbind list
        0x30, 0x0C,                                     // varbind
        0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00,
        0x05, 0x00,                                     // NULL
    };

    REQUIRE(encoded == expected);
    REQUIRE(decodeMessage(encoded) == makeGetRequest());
}

TEST_CASE("Message round trip", "[SnmpMessage]") {
    SECTION("v1 SetRequest with a typed value") {
        SnmpMessage message;
        message.version = SnmpVersion::V1;
        message.community = "private";
        message.pdu.type = PduType::SetRequest;
        message.pdu.requestId = 1;
        message.pdu.varbinds.push_back(
            VarBind{ObjectIdentifier::fromString(".1.3.6.1.4.1.15000.5.2.1.0"), Gauge32{200}});

        REQUIRE(decodeMessage(encodeMessage(message)) == message);
    }

    SECTION("GetResponse with error status") {
        SnmpMessage message = makeGetRequest();
        message.pdu.type = PduType::GetResponse;
        message.pdu.errorStatus = static_cast<int32_t>(SnmpErrorStatus::NoSuchName);
        message.pdu.errorIndex = 1;

        auto decoded = decodeMessage(encodeMessage(message));
        REQUIRE(decoded.pdu.errorStatus == 2);
        REQUIRE(decoded.pdu.errorIndex == 1);
        REQUIRE(decoded.pdu.type == PduType::GetResponse);
    }

    SECTION("Large community forces long-form lengths") {
        SnmpMessage message = makeGetRequest();
        message.community = std::string(300, 'c');
        REQUIRE(decodeMessage(encodeMessage(message)).community == message.community);
    }
}

TEST_CASE("Malformed datagrams", "[SnmpMessage]") {
    auto valid = encodeMessage(makeGetRequest());

    SECTION("Empty input") {
        REQUIRE_THROWS_AS(decodeMessage({}), FormatError);
    }

    SECTION("Truncated input") {
        for (size_t size = 1; size < valid.size(); ++size) {
            std::vector<uint8_t> truncated(valid.begin(), valid.begin() + static_cast<long>(size));
            CHECK_THROWS_AS(decodeMessage(truncated), FormatError);
        }
    }

    SECTION("Unsupported version") {
        auto bad = valid;
        bad[4] = 0x03;  // SNMPv3
        REQUIRE_THROWS_AS(decodeMessage(bad), FormatError);
    }

    SECTION("Unsupported PDU type") {
        auto bad = valid;
        bad[14] = 0xA7;  // SNMPv2-Trap
        REQUIRE_THROWS_AS(decodeMessage(bad), FormatError);
    }

    SECTION("Not a sequence") {
        REQUIRE_THROWS_AS(decodeMessage({0x04, 0x00}), FormatError);
    }
}

TEST_CASE("PDU type names", "[SnmpMessage]") {
    REQUIRE(pduTypeToString(PduType::GetRequest) == "GetRequest");
    REQUIRE(pduTypeToString(PduType::GetResponse) == "GetResponse");
    REQUIRE(pduTypeToString(PduType::SetRequest) == "SetRequest");
}
