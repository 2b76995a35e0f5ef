/**
 * @file SnmpTypes.hpp
 * @brief SNMP protocol versions, variable bindings, request outcomes and
 * common OID constants.
 *
 * This file defines the protocol level types shared by the message codec,
 * the session and the request engine.
 */

#pragma once

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpValue.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmplink::core {

/**
 * @brief Supported SNMP protocol versions.
 *
 * The numeric value is the one carried in the message header.
 */
enum class SnmpVersion : int {
    V1 = 0, ///< SNMP version 1 (community-based)
    V2c = 1 ///< SNMP version 2c (community-based with exception values and Counter64)
};

/**
 * @brief Error status codes as defined in RFC 3416.
 */
enum class SnmpErrorStatus : int {
    NoError = 0,
    TooBig = 1,
    NoSuchName = 2,
    BadValue = 3,
    ReadOnly = 4,
    GenErr = 5,
    NoAccess = 6,
    WrongType = 7,
    WrongLength = 8,
    WrongEncoding = 9,
    WrongValue = 10,
    NoCreation = 11,
    InconsistentValue = 12,
    ResourceUnavailable = 13,
    CommitFailed = 14,
    UndoFailed = 15,
    AuthorizationError = 16,
    NotWritable = 17,
    InconsistentName = 18
};

/**
 * @brief SNMP variable binding (OID + value pair).
 */
struct VarBind {
    ObjectIdentifier oid; ///< Object instance
    SnmpValue value;      ///< Value, Null in GET requests

    bool operator==(const VarBind& other) const = default;
};

/**
 * @brief Result of one GET or SET exchange before interpretation.
 *
 * Either an error indication (nothing usable came back) or a response whose
 * error status and variable bindings the request engine interprets.
 */
struct RequestOutcome {
    std::optional<std::string> errorIndication; ///< Transport failure text
    int errorStatus{0};                         ///< SNMP error status (0 = noError)
    int errorIndex{0};                          ///< Index of varbind that caused error
    std::vector<VarBind> varbinds;              ///< Variable bindings in the response
    std::chrono::microseconds responseTime{0};  ///< Time taken for the exchange

    [[nodiscard]] bool success() const { return !errorIndication && errorStatus == 0; }

    /**
     * @brief Converts response time to milliseconds.
     * @return Response time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }
};

/**
 * @brief Common SNMP OID constants.
 *
 * Contains frequently used OIDs from standard MIBs, in leading-dot notation.
 */
namespace SnmpOids {
    /** @name System MIB (SNMPv2-MIB)
     *  @{ */
    constexpr const char* SYS_DESCR = ".1.3.6.1.2.1.1.1.0";     ///< System description
    constexpr const char* SYS_OBJECT_ID = ".1.3.6.1.2.1.1.2.0"; ///< System object ID
    constexpr const char* SYS_UPTIME = ".1.3.6.1.2.1.1.3.0";    ///< System uptime
    constexpr const char* SYS_CONTACT = ".1.3.6.1.2.1.1.4.0";   ///< System contact
    constexpr const char* SYS_NAME = ".1.3.6.1.2.1.1.5.0";      ///< System name
    constexpr const char* SYS_LOCATION = ".1.3.6.1.2.1.1.6.0";  ///< System location
    constexpr const char* SYS_SERVICES = ".1.3.6.1.2.1.1.7.0";  ///< System services
    /** @} */
}

/**
 * @brief Converts an SNMP version to its string representation.
 * @param version The SNMP version to convert.
 * @return String representation ("v1" or "v2c").
 */
inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "v1";
        case SnmpVersion::V2c: return "v2c";
    }
    return "unknown";
}

/**
 * @brief Parses a string to get the corresponding SNMP version.
 * @param str The string to parse (e.g., "v1", "1", "v2c", "2c").
 * @return The corresponding SnmpVersion (defaults to V2c).
 */
inline SnmpVersion snmpVersionFromString(const std::string& str) {
    if (str == "v1" || str == "1") return SnmpVersion::V1;
    return SnmpVersion::V2c;
}

/**
 * @brief Converts an error status code to its RFC 3416 name.
 * @param errorStatus Raw error status from a response PDU.
 * @return Name such as "noSuchName", or "unknownError(<code>)".
 */
inline std::string snmpErrorStatusToString(int errorStatus) {
    switch (static_cast<SnmpErrorStatus>(errorStatus)) {
        case SnmpErrorStatus::NoError: return "noError";
        case SnmpErrorStatus::TooBig: return "tooBig";
        case SnmpErrorStatus::NoSuchName: return "noSuchName";
        case SnmpErrorStatus::BadValue: return "badValue";
        case SnmpErrorStatus::ReadOnly: return "readOnly";
        case SnmpErrorStatus::GenErr: return "genErr";
        case SnmpErrorStatus::NoAccess: return "noAccess";
        case SnmpErrorStatus::WrongType: return "wrongType";
        case SnmpErrorStatus::WrongLength: return "wrongLength";
        case SnmpErrorStatus::WrongEncoding: return "wrongEncoding";
        case SnmpErrorStatus::WrongValue: return "wrongValue";
        case SnmpErrorStatus::NoCreation: return "noCreation";
        case SnmpErrorStatus::InconsistentValue: return "inconsistentValue";
        case SnmpErrorStatus::ResourceUnavailable: return "resourceUnavailable";
        case SnmpErrorStatus::CommitFailed: return "commitFailed";
        case SnmpErrorStatus::UndoFailed: return "undoFailed";
        case SnmpErrorStatus::AuthorizationError: return "authorizationError";
        case SnmpErrorStatus::NotWritable: return "notWritable";
        case SnmpErrorStatus::InconsistentName: return "inconsistentName";
    }
    return "unknownError(" + std::to_string(errorStatus) + ")";
}

} // namespace snmplink::core
