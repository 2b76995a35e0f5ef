/**
 * @file ISnmpService.hpp
 * @brief Interface for the SNMP request engine.
 *
 * This file defines the abstract interface for performing SNMP GET and SET
 * requests against the agent of a configured session.
 */

#pragma once

#include "core/types/SnmpValue.hpp"

#include <string>

namespace snmplink::core {

/**
 * @brief Interface for SNMP GET/SET requests.
 *
 * OIDs are given as expressions in any notation the OID resolver accepts,
 * e.g. "SNMPv2-MIB::sysDescr.0", ".1.3.6.1.2.1.1.1.0" or "sysDescr.0".
 * Every method either succeeds or throws an SnmpError subclass.
 */
class ISnmpService {
public:
    virtual ~ISnmpService() = default;

    /**
     * @brief Performs an SNMP GET request for one object.
     * @param oid OID expression.
     * @return The value returned by the agent, typed as the loaded MIB
     *         declares the object when the wire tag allows it.
     * @throws NotConfiguredError if no host is set.
     * @throws UnknownSymbolError if the OID cannot be resolved.
     * @throws TransportError if no response was received.
     * @throws AgentError if the agent reported an error status.
     * @throws ObjectNotFoundError if the agent has no such object or instance.
     * @throws FormatError if the response binds another OID.
     */
    virtual SnmpValue get(const std::string& oid) = 0;

    /**
     * @brief Performs an SNMP SET request with a typed value.
     * @param oid OID expression.
     * @param value Value to write; its alternative fixes the wire type.
     */
    virtual void set(const std::string& oid, const SnmpValue& value) = 0;

    /**
     * @brief Performs an SNMP SET request, typing the raw text by the MIB
     * syntax declared for the object.
     * @throws FormatError if no loaded MIB declares a type for the object.
     */
    virtual void set(const std::string& oid, const std::string& raw) = 0;
};

} // namespace snmplink::core
