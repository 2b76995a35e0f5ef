#include "core/types/SnmpValue.hpp"

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpErrors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <type_traits>

namespace snmplink::core {

static_assert(std::variant_size_v<SnmpValue> == 14,
              "SnmpValueType must list every SnmpValue alternative");

namespace {

std::string describe(std::string_view raw) {
    return "\"" + std::string(raw) + "\"";
}

bool allDigits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Parses base-10 text into T. Negative input for an unsigned T is a range
// problem, not a format problem.
template <typename T>
T parseNumber(std::string_view raw, const char* typeName) {
    static_assert(std::is_integral_v<T>);

    if constexpr (std::is_unsigned_v<T>) {
        if (!raw.empty() && raw.front() == '-') {
            auto magnitude = raw.substr(1);
            if (!allDigits(magnitude)) {
                throw FormatError("Value " + describe(raw) + " is not a valid " + typeName);
            }
            if (magnitude.find_first_not_of('0') != std::string_view::npos) {
                throw RangeError("Value " + std::string(raw) + " is out of range for " +
                                 typeName + " [0, " +
                                 std::to_string(std::numeric_limits<T>::max()) + "]");
            }
            return 0;
        }
    }

    using Wide = std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>;
    Wide wide = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), wide);

    if (ec == std::errc::invalid_argument || raw.empty() || ptr != raw.data() + raw.size()) {
        throw FormatError("Value " + describe(raw) + " is not a valid " + typeName);
    }
    if (ec == std::errc::result_out_of_range ||
        wide < static_cast<Wide>(std::numeric_limits<T>::min()) ||
        wide > static_cast<Wide>(std::numeric_limits<T>::max())) {
        throw RangeError("Value " + std::string(raw) + " is out of range for " + typeName +
                         " [" + std::to_string(std::numeric_limits<T>::min()) + ", " +
                         std::to_string(std::numeric_limits<T>::max()) + "]");
    }
    return static_cast<T>(wide);
}

} // namespace

SnmpValueType typeOf(const SnmpValue& value) {
    return static_cast<SnmpValueType>(value.index());
}

bool isNullLike(const SnmpValue& value) {
    return std::holds_alternative<Null>(value) ||
           std::holds_alternative<NoSuchObject>(value) ||
           std::holds_alternative<NoSuchInstance>(value) ||
           std::holds_alternative<EndOfMibView>(value);
}

std::string snmpValueTypeToString(SnmpValueType type) {
    switch (type) {
        case SnmpValueType::Null: return "Null";
        case SnmpValueType::OctetString: return "OCTET STRING";
        case SnmpValueType::Integer: return "INTEGER";
        case SnmpValueType::Integer32: return "Integer32";
        case SnmpValueType::Counter32: return "Counter32";
        case SnmpValueType::Counter64: return "Counter64";
        case SnmpValueType::Gauge32: return "Gauge32";
        case SnmpValueType::Unsigned32: return "Unsigned32";
        case SnmpValueType::TimeTicks: return "TimeTicks";
        case SnmpValueType::IpAddress: return "IpAddress";
        case SnmpValueType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpValueType::NoSuchObject: return "noSuchObject";
        case SnmpValueType::NoSuchInstance: return "noSuchInstance";
        case SnmpValueType::EndOfMibView: return "endOfMibView";
    }
    return "Unknown";
}

std::optional<SnmpValueType> snmpValueTypeFromString(std::string_view name) {
    std::string key;
    for (char c : name) {
        if (c == ' ' || c == '-' || c == '_') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (key == "null") return SnmpValueType::Null;
    if (key == "octetstring") return SnmpValueType::OctetString;
    if (key == "integer") return SnmpValueType::Integer;
    if (key == "integer32") return SnmpValueType::Integer32;
    if (key == "counter32" || key == "counter") return SnmpValueType::Counter32;
    if (key == "counter64") return SnmpValueType::Counter64;
    if (key == "gauge32" || key == "gauge") return SnmpValueType::Gauge32;
    if (key == "unsigned32") return SnmpValueType::Unsigned32;
    if (key == "timeticks") return SnmpValueType::TimeTicks;
    if (key == "ipaddress") return SnmpValueType::IpAddress;
    if (key == "objectidentifier" || key == "oid") return SnmpValueType::ObjectIdentifier;
    return std::nullopt;
}

std::string toString(const SnmpValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, OctetString>) {
                return v.value;
            } else if constexpr (std::is_same_v<T, IpAddress>) {
                return std::to_string(v.value[0]) + "." + std::to_string(v.value[1]) + "." +
                       std::to_string(v.value[2]) + "." + std::to_string(v.value[3]);
            } else if constexpr (std::is_same_v<T, ObjectIdentifierValue>) {
                return ObjectIdentifier(v.value).toString();
            } else if constexpr (std::is_same_v<T, Null> || std::is_same_v<T, NoSuchObject> ||
                                 std::is_same_v<T, NoSuchInstance> ||
                                 std::is_same_v<T, EndOfMibView>) {
                return "";
            } else {
                return std::to_string(v.value);
            }
        },
        value);
}

SnmpValue convertTo(SnmpValueType type, std::string_view raw) {
    switch (type) {
        case SnmpValueType::OctetString: return convertToOctetString(raw);
        case SnmpValueType::Integer: return convertToInteger(raw);
        case SnmpValueType::Integer32: return convertToInteger32(raw);
        case SnmpValueType::Counter32: return convertToCounter32(raw);
        case SnmpValueType::Counter64: return convertToCounter64(raw);
        case SnmpValueType::Gauge32: return convertToGauge32(raw);
        case SnmpValueType::Unsigned32: return convertToUnsigned32(raw);
        case SnmpValueType::TimeTicks: return convertToTimeTicks(raw);
        case SnmpValueType::IpAddress: return convertToIpAddress(raw);
        case SnmpValueType::ObjectIdentifier: return convertToObjectIdentifier(raw);
        case SnmpValueType::Null:
        case SnmpValueType::NoSuchObject:
        case SnmpValueType::NoSuchInstance:
        case SnmpValueType::EndOfMibView:
            break;
    }
    throw FormatError("Cannot convert " + describe(raw) + " to " + snmpValueTypeToString(type));
}

OctetString convertToOctetString(std::string_view raw) {
    return OctetString{std::string(raw)};
}

Integer convertToInteger(std::string_view raw) {
    return Integer{parseNumber<int32_t>(raw, "INTEGER")};
}

Integer32 convertToInteger32(std::string_view raw) {
    return Integer32{parseNumber<int32_t>(raw, "Integer32")};
}

Counter32 convertToCounter32(std::string_view raw) {
    return Counter32{parseNumber<uint32_t>(raw, "Counter32")};
}

Counter64 convertToCounter64(std::string_view raw) {
    return Counter64{parseNumber<uint64_t>(raw, "Counter64")};
}

Gauge32 convertToGauge32(std::string_view raw) {
    return Gauge32{parseNumber<uint32_t>(raw, "Gauge32")};
}

Unsigned32 convertToUnsigned32(std::string_view raw) {
    return Unsigned32{parseNumber<uint32_t>(raw, "Unsigned32")};
}

TimeTicks convertToTimeTicks(std::string_view raw) {
    return TimeTicks{parseNumber<uint32_t>(raw, "TimeTicks")};
}

IpAddress convertToIpAddress(std::string_view raw) {
    IpAddress address;
    std::string_view rest = raw;

    for (size_t i = 0; i < address.value.size(); ++i) {
        auto dot = rest.find('.');
        bool last = (i + 1 == address.value.size());
        if (last != (dot == std::string_view::npos)) {
            throw FormatError("Value " + describe(raw) + " is not a valid IpAddress");
        }

        auto octet = rest.substr(0, dot);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(octet.data(), octet.data() + octet.size(), value);
        if (octet.empty() || ec != std::errc() || ptr != octet.data() + octet.size() ||
            value > 255) {
            throw FormatError("Value " + describe(raw) + " is not a valid IpAddress");
        }
        address.value[i] = static_cast<uint8_t>(value);

        if (!last) {
            rest.remove_prefix(dot + 1);
        }
    }

    return address;
}

ObjectIdentifierValue convertToObjectIdentifier(std::string_view raw) {
    return ObjectIdentifierValue{ObjectIdentifier::fromString(std::string(raw)).components};
}

} // namespace snmplink::core
