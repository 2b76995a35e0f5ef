/**
 * @file IMibLookup.hpp
 * @brief Interface for the MIB lookup service.
 *
 * This file defines the abstract interface used by the OID resolver and the
 * session to map MIB module/symbol names to numeric OIDs and value types.
 */

#pragma once

#include "core/types/MibSymbol.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snmplink::core {

/**
 * @brief Interface for the MIB lookup service.
 *
 * Implementations act as an append-only cache of loaded modules that may be
 * shared by several sessions, so they must be internally synchronized.
 */
class IMibLookup {
public:
    virtual ~IMibLookup() = default;

    /**
     * @brief Resolves a module-qualified or bare symbol name.
     *
     * A named module that is not loaded yet is loaded from the search path.
     * An empty module searches every loaded module in load order.
     *
     * @param module MIB module name, or empty to search all modules.
     * @param symbol Symbol name such as "sysDescr".
     * @return The symbol, or std::nullopt if it cannot be found.
     */
    virtual std::optional<MibSymbol> resolve(const std::string& module,
                                             const std::string& symbol) = 0;

    /**
     * @brief Resolves a label as a direct child of an OID.
     *
     * Used for mixed notations such as ".iso.org.6.internet".
     *
     * @param parent OID built so far (may be empty for a top-level label).
     * @param label Child symbol name.
     * @return The child symbol, or std::nullopt if no loaded symbol matches.
     */
    virtual std::optional<MibSymbol> resolveChild(const ObjectIdentifier& parent,
                                                  const std::string& label) = 0;

    /**
     * @brief Finds the loaded symbol with the longest OID prefix of an instance OID.
     * @param oid Instance OID (e.g. ".1.3.6.1.2.1.1.6.0").
     * @return The closest defining symbol, or std::nullopt.
     */
    virtual std::optional<MibSymbol> findByOid(const ObjectIdentifier& oid) const = 0;

    /**
     * @brief Loads modules and their imports.
     * @param names Module names; an empty list loads every available module.
     * @throws UnknownSymbolError if a named module cannot be found.
     * @throws FormatError if a module file is malformed.
     */
    virtual void loadModules(const std::vector<std::string>& names) = 0;

    /**
     * @brief Names of the loaded modules, in load order.
     */
    virtual std::vector<std::string> loadedModules() const = 0;

    /**
     * @brief Directories consulted, in order, when loading modules.
     */
    virtual std::vector<std::filesystem::path> searchPath() const = 0;

    /**
     * @brief Replaces the ordered search path.
     */
    virtual void setSearchPath(std::vector<std::filesystem::path> paths) = 0;

    /**
     * @brief Adds one directory to the end of the search path as a single update.
     */
    virtual void appendSearchPath(const std::filesystem::path& path) = 0;
};

} // namespace snmplink::core
