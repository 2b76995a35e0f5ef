#include <catch2/catch_test_macros.hpp>

#include "core/types/SnmpErrors.hpp"
#include "core/types/SnmpValue.hpp"

using namespace snmplink::core;

TEST_CASE("Integer32 conversion boundaries", "[SnmpValue]") {
    SECTION("Accepts the signed 32-bit range") {
        REQUIRE(convertToInteger32("2147483647").value == 2147483647);
        REQUIRE(convertToInteger32("-2147483648").value == INT32_MIN);
        REQUIRE(convertToInteger32("0").value == 0);
        REQUIRE(convertToInteger("-42").value == -42);
    }

    SECTION("Rejects values one past either end") {
        REQUIRE_THROWS_AS(convertToInteger32("2147483648"), RangeError);
        REQUIRE_THROWS_AS(convertToInteger32("-2147483649"), RangeError);
        REQUIRE_THROWS_AS(convertToInteger("99999999999999999999999"), RangeError);
    }
}

TEST_CASE("Unsigned conversion boundaries", "[SnmpValue]") {
    SECTION("32-bit types accept [0, 2^32-1]") {
        REQUIRE(convertToCounter32("4294967295").value == 4294967295u);
        REQUIRE(convertToGauge32("0").value == 0u);
        REQUIRE(convertToUnsigned32("4294967295").value == 4294967295u);
        REQUIRE(convertToTimeTicks("123456").value == 123456u);
    }

    SECTION("32-bit types reject 2^32") {
        REQUIRE_THROWS_AS(convertToCounter32("4294967296"), RangeError);
        REQUIRE_THROWS_AS(convertToGauge32("4294967296"), RangeError);
        REQUIRE_THROWS_AS(convertToUnsigned32("4294967296"), RangeError);
        REQUIRE_THROWS_AS(convertToTimeTicks("4294967296"), RangeError);
    }

    SECTION("Counter64 accepts [0, 2^64-1]") {
        REQUIRE(convertToCounter64("18446744073709551615").value == UINT64_MAX);
        REQUIRE_THROWS_AS(convertToCounter64("18446744073709551616"), RangeError);
    }

    SECTION("Negative input is a range error") {
        REQUIRE_THROWS_AS(convertToCounter32("-1"), RangeError);
        REQUIRE_THROWS_AS(convertToGauge32("-200"), RangeError);
        REQUIRE_THROWS_AS(convertToCounter64("-1"), RangeError);
        REQUIRE_THROWS_AS(convertToTimeTicks("-5"), RangeError);
    }

    SECTION("Negative zero is zero") {
        REQUIRE(convertToGauge32("-0").value == 0u);
    }
}

TEST_CASE("Non-numeric input is a format error", "[SnmpValue]") {
    REQUIRE_THROWS_AS(convertToInteger32(""), FormatError);
    REQUIRE_THROWS_AS(convertToInteger32("abc"), FormatError);
    REQUIRE_THROWS_AS(convertToInteger32("12abc"), FormatError);
    REQUIRE_THROWS_AS(convertToInteger32(" 12"), FormatError);
    REQUIRE_THROWS_AS(convertToGauge32("+5"), FormatError);
    REQUIRE_THROWS_AS(convertToCounter32("-x"), FormatError);
    REQUIRE_THROWS_AS(convertToTimeTicks("1.5"), FormatError);
}

TEST_CASE("Conversion errors are SnmpErrors", "[SnmpValue]") {
    REQUIRE_THROWS_AS(convertToGauge32("nope"), SnmpError);
    REQUIRE_THROWS_AS(convertToGauge32("-1"), SnmpError);
}

TEST_CASE("Octet strings take any bytes", "[SnmpValue]") {
    REQUIRE(convertToOctetString("Test").value == "Test");
    REQUIRE(convertToOctetString("").value.empty());

    std::string binary("\x00\xff\x10", 3);
    REQUIRE(convertToOctetString(binary).value == binary);
}

TEST_CASE("IpAddress and OID conversion", "[SnmpValue]") {
    SECTION("Dotted quad") {
        auto address = convertToIpAddress("192.168.1.254");
        REQUIRE(address.value == std::array<uint8_t, 4>{192, 168, 1, 254});
        REQUIRE(toString(SnmpValue(address)) == "192.168.1.254");
    }

    SECTION("Malformed addresses") {
        REQUIRE_THROWS_AS(convertToIpAddress("192.168.1"), FormatError);
        REQUIRE_THROWS_AS(convertToIpAddress("192.168.1.256"), FormatError);
        REQUIRE_THROWS_AS(convertToIpAddress("192.168.1.1.1"), FormatError);
        REQUIRE_THROWS_AS(convertToIpAddress("a.b.c.d"), FormatError);
    }

    SECTION("Object identifiers with or without leading dot") {
        auto oid = convertToObjectIdentifier("1.3.6.1.4.1.15000");
        REQUIRE(oid.value == std::vector<uint32_t>{1, 3, 6, 1, 4, 1, 15000});
        REQUIRE(convertToObjectIdentifier(".1.3.6").value == std::vector<uint32_t>{1, 3, 6});
        REQUIRE(toString(SnmpValue(oid)) == ".1.3.6.1.4.1.15000");
        REQUIRE_THROWS_AS(convertToObjectIdentifier("1..3"), FormatError);
    }
}

TEST_CASE("convertTo dispatches on the type tag", "[SnmpValue]") {
    REQUIRE(convertTo(SnmpValueType::Gauge32, "200") == SnmpValue(Gauge32{200}));
    REQUIRE(convertTo(SnmpValueType::Unsigned32, "200") == SnmpValue(Unsigned32{200}));
    REQUIRE(convertTo(SnmpValueType::Integer, "7") == SnmpValue(Integer{7}));
    REQUIRE(convertTo(SnmpValueType::Integer32, "7") == SnmpValue(Integer32{7}));
    REQUIRE(convertTo(SnmpValueType::OctetString, "x") == SnmpValue(OctetString{"x"}));

    SECTION("Types sharing a wire tag stay distinct") {
        REQUIRE(convertTo(SnmpValueType::Gauge32, "1") != SnmpValue(Unsigned32{1}));
        REQUIRE(convertTo(SnmpValueType::Integer, "1") != SnmpValue(Integer32{1}));
    }

    SECTION("Null-like types cannot be produced from text") {
        REQUIRE_THROWS_AS(convertTo(SnmpValueType::Null, ""), FormatError);
        REQUIRE_THROWS_AS(convertTo(SnmpValueType::NoSuchObject, ""), FormatError);
        REQUIRE_THROWS_AS(convertTo(SnmpValueType::EndOfMibView, ""), FormatError);
    }
}

TEST_CASE("toString is the inverse of conversion for canonical text", "[SnmpValue]") {
    const std::vector<std::pair<SnmpValueType, std::string>> samples = {
        {SnmpValueType::OctetString, "New System Description"},
        {SnmpValueType::Integer, "-2147483648"},
        {SnmpValueType::Integer32, "2147483647"},
        {SnmpValueType::Counter32, "4294967295"},
        {SnmpValueType::Counter64, "18446744073709551615"},
        {SnmpValueType::Gauge32, "200"},
        {SnmpValueType::Unsigned32, "0"},
        {SnmpValueType::TimeTicks, "8640000"},
        {SnmpValueType::IpAddress, "10.0.111.112"},
        {SnmpValueType::ObjectIdentifier, ".1.3.6.1.4.1.15000.5"},
    };

    for (const auto& [type, text] : samples) {
        auto value = convertTo(type, text);
        CHECK(typeOf(value) == type);
        CHECK(toString(value) == text);
    }
}

TEST_CASE("Null-like values", "[SnmpValue]") {
    REQUIRE(isNullLike(SnmpValue(Null{})));
    REQUIRE(isNullLike(SnmpValue(NoSuchObject{})));
    REQUIRE(isNullLike(SnmpValue(NoSuchInstance{})));
    REQUIRE(isNullLike(SnmpValue(EndOfMibView{})));
    REQUIRE_FALSE(isNullLike(SnmpValue(Integer{0})));
    REQUIRE_FALSE(isNullLike(SnmpValue(OctetString{})));

    REQUIRE(toString(SnmpValue(NoSuchInstance{})).empty());
}

TEST_CASE("Value type names", "[SnmpValue]") {
    SECTION("snmpValueTypeToString") {
        REQUIRE(snmpValueTypeToString(SnmpValueType::OctetString) == "OCTET STRING");
        REQUIRE(snmpValueTypeToString(SnmpValueType::Gauge32) == "Gauge32");
        REQUIRE(snmpValueTypeToString(SnmpValueType::ObjectIdentifier) == "OBJECT IDENTIFIER");
        REQUIRE(snmpValueTypeToString(SnmpValueType::NoSuchObject) == "noSuchObject");
    }

    SECTION("snmpValueTypeFromString ignores case and separators") {
        REQUIRE(snmpValueTypeFromString("OCTET STRING") == SnmpValueType::OctetString);
        REQUIRE(snmpValueTypeFromString("octet-string") == SnmpValueType::OctetString);
        REQUIRE(snmpValueTypeFromString("gauge32") == SnmpValueType::Gauge32);
        REQUIRE(snmpValueTypeFromString("Gauge") == SnmpValueType::Gauge32);
        REQUIRE(snmpValueTypeFromString("time_ticks") == SnmpValueType::TimeTicks);
        REQUIRE(snmpValueTypeFromString("oid") == SnmpValueType::ObjectIdentifier);
        REQUIRE_FALSE(snmpValueTypeFromString("Float").has_value());
    }
}
