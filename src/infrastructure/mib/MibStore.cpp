#include "infrastructure/mib/MibStore.hpp"

#include "core/types/SnmpErrors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace snmplink::infra {

namespace {

constexpr const char* MODULE_FILE_EXTENSION = ".json";

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += " ";
        joined += name;
    }
    return joined;
}

} // anonymous namespace

MibStore::MibStore(std::vector<std::filesystem::path> searchPath)
    : searchPath_(std::move(searchPath)) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> visiting;
    std::vector<MibModuleDefinition> staged;
    stageModuleLocked("SNMPv2-SMI", visiting, staged);
    commitLocked(staged);
}

std::optional<core::MibSymbol> MibStore::resolve(const std::string& module,
                                                 const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!module.empty()) {
        if (modules_.find(module) == modules_.end()) {
            if (!findModuleLocked(module)) {
                spdlog::debug("MIB module {} not found in search path", module);
                return std::nullopt;
            }
            std::set<std::string> visiting;
            std::vector<MibModuleDefinition> staged;
            stageModuleLocked(module, visiting, staged);
            commitLocked(staged);
        }
        return findSymbolLocked(module, symbol);
    }

    if (auto found = findSymbolLocked("", symbol)) {
        return found;
    }
    if (!allLoaded_) {
        loadAllLocked(false);
        return findSymbolLocked("", symbol);
    }
    return std::nullopt;
}

std::optional<core::MibSymbol> MibStore::resolveChild(const core::ObjectIdentifier& parent,
                                                      const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto found = findChildLocked(parent, label)) {
        return found;
    }
    if (!allLoaded_) {
        loadAllLocked(false);
        return findChildLocked(parent, label);
    }
    return std::nullopt;
}

std::optional<core::MibSymbol> MibStore::findByOid(const core::ObjectIdentifier& oid) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const core::MibSymbol* best = nullptr;
    for (const auto& name : loadOrder_) {
        for (const auto& symbol : modules_.at(name)) {
            if (symbol.oid.isPrefixOf(oid) && (!best || symbol.oid.size() > best->oid.size())) {
                best = &symbol;
            }
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return *best;
}

void MibStore::loadModules(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (names.empty()) {
        loadAllLocked(true);
        return;
    }

    std::set<std::string> visiting;
    std::vector<MibModuleDefinition> staged;
    for (const auto& name : names) {
        stageModuleLocked(name, visiting, staged);
    }
    commitLocked(staged);
}

std::vector<std::string> MibStore::loadedModules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadOrder_;
}

std::vector<std::filesystem::path> MibStore::searchPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return searchPath_;
}

void MibStore::setSearchPath(std::vector<std::filesystem::path> paths) {
    std::lock_guard<std::mutex> lock(mutex_);
    searchPath_ = std::move(paths);
    allLoaded_ = false;
}

void MibStore::appendSearchPath(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    searchPath_.push_back(path);
    allLoaded_ = false;
}

std::vector<std::string> MibStore::availableModules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return availableModulesLocked();
}

std::optional<core::SnmpValueType> MibStore::syntaxToValueType(const std::string& syntax) {
    using core::SnmpValueType;

    // Textual conventions from SNMPv2-TC, SNMP-FRAMEWORK-MIB and IF-MIB
    static const std::map<std::string, SnmpValueType> textualConventions = {
        {"DisplayString", SnmpValueType::OctetString},
        {"PhysAddress", SnmpValueType::OctetString},
        {"MacAddress", SnmpValueType::OctetString},
        {"SnmpAdminString", SnmpValueType::OctetString},
        {"OwnerString", SnmpValueType::OctetString},
        {"DateAndTime", SnmpValueType::OctetString},
        {"Opaque", SnmpValueType::OctetString},
        {"TimeStamp", SnmpValueType::TimeTicks},
        {"TimeInterval", SnmpValueType::Integer},
        {"TruthValue", SnmpValueType::Integer},
        {"RowStatus", SnmpValueType::Integer},
        {"StorageType", SnmpValueType::Integer},
        {"TestAndIncr", SnmpValueType::Integer},
        {"IANAifType", SnmpValueType::Integer},
        {"InterfaceIndex", SnmpValueType::Integer32},
        {"InterfaceIndexOrZero", SnmpValueType::Integer32},
        {"AutonomousType", SnmpValueType::ObjectIdentifier},
        {"RowPointer", SnmpValueType::ObjectIdentifier},
        {"VariablePointer", SnmpValueType::ObjectIdentifier},
        {"NetworkAddress", SnmpValueType::IpAddress},
    };

    auto it = textualConventions.find(syntax);
    if (it != textualConventions.end()) {
        return it->second;
    }

    auto type = core::snmpValueTypeFromString(syntax);
    if (type && *type != SnmpValueType::Null && *type < SnmpValueType::NoSuchObject) {
        return type;
    }
    return std::nullopt;
}

MibModuleDefinition MibStore::parseJsonModule(const std::filesystem::path& file,
                                              const std::string& moduleName) {
    std::ifstream in(file);
    if (!in) {
        throw core::FormatError("Failed to open MIB module file: " + file.string());
    }

    MibModuleDefinition module;
    module.name = moduleName;

    try {
        nlohmann::json j;
        in >> j;

        if (!j.is_object()) {
            throw core::FormatError("MIB module file " + file.string() + " is not a JSON object");
        }

        if (j.contains("meta")) {
            auto declared = j["meta"].value("module", moduleName);
            if (declared != moduleName) {
                spdlog::warn("MIB module file {} declares module {}", file.string(), declared);
            }
        }

        if (j.contains("imports") && j["imports"].is_object()) {
            for (const auto& [name, symbols] : j["imports"].items()) {
                if (symbols.is_array() && name != moduleName) {
                    module.imports.push_back(name);
                }
            }
        }

        for (const auto& [name, entry] : j.items()) {
            if (name == "meta" || name == "imports" || !entry.is_object() ||
                !entry.contains("oid")) {
                continue;
            }

            core::MibSymbol symbol;
            symbol.module = moduleName;
            symbol.name = entry.value("name", name);
            symbol.oid = core::ObjectIdentifier::fromString(entry["oid"].get<std::string>());

            if (entry.contains("syntax") && entry["syntax"].is_object() &&
                entry["syntax"].contains("type")) {
                auto syntax = entry["syntax"]["type"].get<std::string>();
                symbol.syntax = syntaxToValueType(syntax);
                if (!symbol.syntax) {
                    spdlog::debug("Unknown syntax {} for {}::{}", syntax, moduleName, symbol.name);
                }
            }

            module.symbols.push_back(std::move(symbol));
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::FormatError("Malformed MIB module file " + file.string() + ": " + e.what());
    }

    return module;
}

std::optional<MibModuleDefinition> MibStore::findModuleLocked(const std::string& name) const {
    for (const auto& dir : searchPath_) {
        auto candidate = dir / (name + MODULE_FILE_EXTENSION);
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return parseJsonModule(candidate, name);
        }
    }
    return builtinMib(name);
}

void MibStore::stageModuleLocked(const std::string& name,
                                 std::set<std::string>& visiting,
                                 std::vector<MibModuleDefinition>& staged) const {
    if (modules_.count(name) || visiting.count(name)) {
        return;
    }
    visiting.insert(name);

    auto definition = findModuleLocked(name);
    if (!definition) {
        throw core::UnknownSymbolError("MIB module \"" + name + "\" not found");
    }

    for (const auto& import : definition->imports) {
        stageModuleLocked(import, visiting, staged);
    }
    staged.push_back(std::move(*definition));
}

void MibStore::commitLocked(std::vector<MibModuleDefinition>& staged) {
    for (auto& module : staged) {
        spdlog::debug("Loaded MIB module {} ({} symbols)", module.name, module.symbols.size());
        loadOrder_.push_back(module.name);
        modules_[module.name] = std::move(module.symbols);
    }
    staged.clear();
}

void MibStore::loadAllLocked(bool strict) {
    for (const auto& name : availableModulesLocked()) {
        std::set<std::string> visiting;
        std::vector<MibModuleDefinition> staged;
        try {
            stageModuleLocked(name, visiting, staged);
        } catch (const core::SnmpError& e) {
            if (strict) {
                throw;
            }
            spdlog::warn("Skipping MIB module {}: {}", name, e.what());
            continue;
        }
        commitLocked(staged);
    }
    allLoaded_ = true;
}

std::vector<std::string> MibStore::availableModulesLocked() const {
    std::vector<std::string> names;

    for (const auto& dir : searchPath_) {
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            spdlog::debug("Cannot list MIB directory {}: {}", dir.string(), ec.message());
            continue;
        }

        std::vector<std::string> dirNames;
        for (const auto& entry : it) {
            if (entry.path().extension() == MODULE_FILE_EXTENSION) {
                dirNames.push_back(entry.path().stem().string());
            }
        }
        std::sort(dirNames.begin(), dirNames.end());
        for (auto& name : dirNames) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(std::move(name));
            }
        }
    }

    for (auto& name : builtinMibNames()) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(std::move(name));
        }
    }

    spdlog::debug("Available MIB modules: {}", joinNames(names));
    return names;
}

std::optional<core::MibSymbol> MibStore::findSymbolLocked(const std::string& module,
                                                          const std::string& symbol) const {
    if (!module.empty()) {
        auto it = modules_.find(module);
        if (it == modules_.end()) {
            return std::nullopt;
        }
        for (const auto& candidate : it->second) {
            if (candidate.name == symbol) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    for (const auto& name : loadOrder_) {
        if (auto found = findSymbolLocked(name, symbol)) {
            return found;
        }
    }
    return std::nullopt;
}

std::optional<core::MibSymbol> MibStore::findChildLocked(const core::ObjectIdentifier& parent,
                                                         const std::string& label) const {
    for (const auto& name : loadOrder_) {
        for (const auto& candidate : modules_.at(name)) {
            if (candidate.name == label && candidate.oid.size() == parent.size() + 1 &&
                parent.isPrefixOf(candidate.oid)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

} // namespace snmplink::infra
