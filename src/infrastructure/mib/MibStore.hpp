#pragma once

#include "core/services/IMibLookup.hpp"
#include "infrastructure/mib/BuiltinMibs.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace snmplink::infra {

/**
 * @brief MIB lookup service backed by compiled-in and pre-compiled JSON modules.
 *
 * Modules are looked up as `<MODULE>.json` in each search path directory, in
 * order, before falling back to the compiled-in modules. The JSON layout is
 * the one written by pysmi's JSON code generator: every top-level key is a
 * symbol name mapping to an object with "oid" and an optional
 * "syntax": {"type": ...}; "meta" and "imports" are reserved keys.
 *
 * SNMPv2-SMI is always loaded. Loaded modules are never unloaded, so a store
 * can be shared by several sessions.
 *
 * @note This class is non-copyable. All methods are thread-safe.
 */
class MibStore : public core::IMibLookup {
public:
    /**
     * @brief Constructs a store with an initial search path.
     * @param searchPath Directories holding `<MODULE>.json` files.
     */
    explicit MibStore(std::vector<std::filesystem::path> searchPath = {});

    ~MibStore() override = default;

    MibStore(const MibStore&) = delete;
    MibStore& operator=(const MibStore&) = delete;

    std::optional<core::MibSymbol> resolve(const std::string& module,
                                           const std::string& symbol) override;

    std::optional<core::MibSymbol> resolveChild(const core::ObjectIdentifier& parent,
                                                const std::string& label) override;

    std::optional<core::MibSymbol> findByOid(const core::ObjectIdentifier& oid) const override;

    void loadModules(const std::vector<std::string>& names) override;

    std::vector<std::string> loadedModules() const override;

    std::vector<std::filesystem::path> searchPath() const override;

    void setSearchPath(std::vector<std::filesystem::path> paths) override;

    void appendSearchPath(const std::filesystem::path& path) override;

    /**
     * @brief Names of all modules that could be loaded: search path files
     * and compiled-in modules.
     */
    std::vector<std::string> availableModules() const;

    /**
     * @brief Maps an SMI syntax or textual convention name to a base value type.
     * @param syntax Name such as "DisplayString", "Gauge32" or "OCTET STRING".
     * @return The base type, or std::nullopt for an unknown syntax.
     */
    static std::optional<core::SnmpValueType> syntaxToValueType(const std::string& syntax);

    /**
     * @brief Parses a pre-compiled JSON module file.
     * @throws core::FormatError if the file cannot be read or parsed.
     */
    static MibModuleDefinition parseJsonModule(const std::filesystem::path& file,
                                               const std::string& moduleName);

private:
    // Definition of a module from the search path or the compiled-in set
    std::optional<MibModuleDefinition> findModuleLocked(const std::string& name) const;

    // Collects a module and its imports into `staged`, imports first
    void stageModuleLocked(const std::string& name,
                           std::set<std::string>& visiting,
                           std::vector<MibModuleDefinition>& staged) const;

    void commitLocked(std::vector<MibModuleDefinition>& staged);

    // Loads every available module; in lenient mode broken modules are skipped
    void loadAllLocked(bool strict);

    std::vector<std::string> availableModulesLocked() const;

    std::optional<core::MibSymbol> findSymbolLocked(const std::string& module,
                                                    const std::string& symbol) const;

    std::optional<core::MibSymbol> findChildLocked(const core::ObjectIdentifier& parent,
                                                   const std::string& label) const;

    std::vector<std::filesystem::path> searchPath_;
    std::vector<std::string> loadOrder_;
    std::map<std::string, std::vector<core::MibSymbol>> modules_;
    bool allLoaded_{false};
    mutable std::mutex mutex_;
};

} // namespace snmplink::infra
