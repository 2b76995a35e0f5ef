#pragma once

#include "core/types/MibSymbol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace snmplink::infra {

/**
 * @brief A MIB module compiled into the library.
 */
struct MibModuleDefinition {
    std::string name;                 ///< Module name, e.g. "SNMPv2-MIB"
    std::vector<std::string> imports; ///< Modules that must be loaded first
    std::vector<core::MibSymbol> symbols;
};

/**
 * @brief Names of the compiled-in modules ("SNMPv2-SMI", "SNMPv2-MIB", "IF-MIB").
 */
std::vector<std::string> builtinMibNames();

/**
 * @brief Returns a compiled-in module by name.
 * @return The definition, or std::nullopt if the module is not built in.
 */
std::optional<MibModuleDefinition> builtinMib(const std::string& name);

} // namespace snmplink::infra
