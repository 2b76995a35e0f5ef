/**
 * @file SnmpErrors.hpp
 * @brief Exception types reported by the SNMP client.
 *
 * Every public operation either succeeds or throws exactly one of the types
 * below. All of them derive from SnmpError so callers can catch the family.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace snmplink::core {

/**
 * @brief Base class of all SNMP client errors.
 */
class SnmpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A request was attempted before a host was configured.
 */
class NotConfiguredError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief A MIB search path addition referenced a missing or unreadable directory.
 */
class PathNotFoundError : public SnmpError {
public:
    explicit PathNotFoundError(const std::filesystem::path& path)
        : SnmpError("Path \"" + path.string() + "\" does not exist"), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief A symbolic OID component or MIB module could not be resolved.
 */
class UnknownSymbolError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief A value lies outside the declared width of its SNMP type.
 */
class RangeError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief A value or datagram does not have the required shape.
 */
class FormatError : public SnmpError {
public:
    using SnmpError::SnmpError;
};

/**
 * @brief Transport level failure: timeout, resolver or socket error.
 */
class TransportError : public SnmpError {
public:
    TransportError(const std::string& message, std::string errorIndication)
        : SnmpError(message), errorIndication_(std::move(errorIndication)) {}

    /// The indication reported by the transport, e.g. the timeout text.
    const std::string& errorIndication() const { return errorIndication_; }

private:
    std::string errorIndication_;
};

/**
 * @brief The agent answered with a non-zero error status.
 */
class AgentError : public SnmpError {
public:
    AgentError(const std::string& message, int errorStatus, std::string statusText, int errorIndex)
        : SnmpError(message),
          errorStatus_(errorStatus),
          statusText_(std::move(statusText)),
          errorIndex_(errorIndex) {}

    int errorStatus() const { return errorStatus_; }
    const std::string& statusText() const { return statusText_; }
    int errorIndex() const { return errorIndex_; }

private:
    int errorStatus_;
    std::string statusText_;
    int errorIndex_;
};

/**
 * @brief A GET succeeded on the wire but the agent has no such object.
 */
class ObjectNotFoundError : public SnmpError {
public:
    explicit ObjectNotFoundError(const std::string& oid)
        : SnmpError("Object with OID \"" + oid + "\" not found"), oid_(oid) {}

    /// Dotted numeric OID with leading dot.
    const std::string& oid() const { return oid_; }

private:
    std::string oid_;
};

} // namespace snmplink::core
