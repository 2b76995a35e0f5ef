/**
 * @file MibSymbol.hpp
 * @brief A named MIB object as returned by the lookup service.
 */

#pragma once

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpValue.hpp"

#include <optional>
#include <string>

namespace snmplink::core {

/**
 * @brief One symbol of a loaded MIB module.
 */
struct MibSymbol {
    std::string module;                  ///< Defining module (e.g. "SNMPv2-MIB")
    std::string name;                    ///< Symbol name (e.g. "sysDescr")
    ObjectIdentifier oid;                ///< Numeric OID of the symbol
    std::optional<SnmpValueType> syntax; ///< Declared value type for object types

    bool operator==(const MibSymbol& other) const = default;
};

} // namespace snmplink::core
