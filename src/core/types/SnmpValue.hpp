/**
 * @file SnmpValue.hpp
 * @brief SNMP value types and their conversion from raw text.
 *
 * Each SNMP type (RFC 2578) is a distinct struct carrying a value of exactly
 * its declared width. SnmpValue is the tagged union over all of them. The
 * wire tag of a value is fixed by its alternative, so two alternatives that
 * share a BER tag (Integer/Integer32, Gauge32/Unsigned32) never convert into
 * each other implicitly.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace snmplink::core {

/// ASN.1 NULL, also used as the placeholder value in GET requests.
struct Null {
    bool operator==(const Null& other) const = default;
};

/// Arbitrary binary or text data.
struct OctetString {
    std::string value;
    bool operator==(const OctetString& other) const = default;
};

/// INTEGER, signed 32-bit.
struct Integer {
    int32_t value{0};
    bool operator==(const Integer& other) const = default;
};

/// Integer32, signed 32-bit.
struct Integer32 {
    int32_t value{0};
    bool operator==(const Integer32& other) const = default;
};

/// Counter32, unsigned 32-bit counter that wraps at 2^32.
struct Counter32 {
    uint32_t value{0};
    bool operator==(const Counter32& other) const = default;
};

/// Counter64, unsigned 64-bit counter (SNMPv2c only).
struct Counter64 {
    uint64_t value{0};
    bool operator==(const Counter64& other) const = default;
};

/// Gauge32, unsigned 32-bit value that may increase or decrease.
struct Gauge32 {
    uint32_t value{0};
    bool operator==(const Gauge32& other) const = default;
};

/// Unsigned32, shares the Gauge32 wire tag.
struct Unsigned32 {
    uint32_t value{0};
    bool operator==(const Unsigned32& other) const = default;
};

/// Hundredths of a second.
struct TimeTicks {
    uint32_t value{0};
    bool operator==(const TimeTicks& other) const = default;
};

/// 32-bit IPv4 address in network order.
struct IpAddress {
    std::array<uint8_t, 4> value{};
    bool operator==(const IpAddress& other) const = default;
};

/// OBJECT IDENTIFIER used as a value (e.g. sysObjectID).
struct ObjectIdentifierValue {
    std::vector<uint32_t> value;
    bool operator==(const ObjectIdentifierValue& other) const = default;
};

/// SNMPv2c exception: no object at this OID.
struct NoSuchObject {
    bool operator==(const NoSuchObject& other) const = default;
};

/// SNMPv2c exception: no instance at this OID.
struct NoSuchInstance {
    bool operator==(const NoSuchInstance& other) const = default;
};

/// SNMPv2c exception: end of the MIB view reached.
struct EndOfMibView {
    bool operator==(const EndOfMibView& other) const = default;
};

/**
 * @brief Tagged union over every SNMP value type.
 *
 * The alternative order matches SnmpValueType.
 */
using SnmpValue = std::variant<Null,
                               OctetString,
                               Integer,
                               Integer32,
                               Counter32,
                               Counter64,
                               Gauge32,
                               Unsigned32,
                               TimeTicks,
                               IpAddress,
                               ObjectIdentifierValue,
                               NoSuchObject,
                               NoSuchInstance,
                               EndOfMibView>;

/**
 * @brief Discriminator of SnmpValue, in alternative order.
 */
enum class SnmpValueType : int {
    Null = 0,
    OctetString = 1,
    Integer = 2,
    Integer32 = 3,
    Counter32 = 4,
    Counter64 = 5,
    Gauge32 = 6,
    Unsigned32 = 7,
    TimeTicks = 8,
    IpAddress = 9,
    ObjectIdentifier = 10,
    NoSuchObject = 11,
    NoSuchInstance = 12,
    EndOfMibView = 13
};

/**
 * @brief Returns the type tag of a value.
 */
SnmpValueType typeOf(const SnmpValue& value);

/**
 * @brief True for Null and the three SNMPv2c exception values.
 */
bool isNullLike(const SnmpValue& value);

/**
 * @brief Converts a value type to its SMI name (e.g. "Gauge32", "OCTET STRING").
 */
std::string snmpValueTypeToString(SnmpValueType type);

/**
 * @brief Parses a type name, case-insensitively and ignoring blanks, dashes and
 * underscores ("gauge32", "OCTET STRING", "octet-string", "TimeTicks").
 * @return The type, or std::nullopt for an unknown name.
 */
std::optional<SnmpValueType> snmpValueTypeFromString(std::string_view name);

/**
 * @brief Canonical textual form of a value.
 *
 * Numbers in decimal, octet strings as their bytes, IP addresses as a dotted
 * quad, OIDs in leading-dot notation and an empty string for null-like values.
 */
std::string toString(const SnmpValue& value);

/**
 * @brief Converts raw text into a value of the given type.
 * @param type Target type.
 * @param raw Raw text, e.g. "200" or "Test".
 * @return The converted value.
 * @throws RangeError if the number does not fit the type's width.
 * @throws FormatError if the text is not of the required shape.
 */
SnmpValue convertTo(SnmpValueType type, std::string_view raw);

OctetString convertToOctetString(std::string_view raw);
Integer convertToInteger(std::string_view raw);
Integer32 convertToInteger32(std::string_view raw);
Counter32 convertToCounter32(std::string_view raw);
Counter64 convertToCounter64(std::string_view raw);
Gauge32 convertToGauge32(std::string_view raw);
Unsigned32 convertToUnsigned32(std::string_view raw);
TimeTicks convertToTimeTicks(std::string_view raw);
IpAddress convertToIpAddress(std::string_view raw);
ObjectIdentifierValue convertToObjectIdentifier(std::string_view raw);

} // namespace snmplink::core
