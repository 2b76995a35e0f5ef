#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace snmplink::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the default agent, the transport policy, the MIB search path and
 * the logging setup. Command line options override these values.
 */
struct AppConfig {
    // Agent
    std::string host;                                  ///< Agent host, empty if unset.
    uint16_t port{161};                                ///< Agent UDP port.
    std::string community{"public"};                   ///< Community string.
    core::SnmpVersion version{core::SnmpVersion::V2c}; ///< Protocol version.

    // Transport
    int timeoutMs{1000}; ///< Wait per try in milliseconds.
    int retries{5};      ///< Re-sends after the first try.

    // MIB
    std::vector<std::string> mibSearchPaths; ///< Directories with pre-compiled MIB modules.
    std::vector<std::string> preloadMibs;    ///< Modules loaded at startup.

    // Logging
    std::string logLevel{"warn"}; ///< spdlog level name.
    std::string logFile;          ///< Rotating log file, empty to log to stderr only.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration from `config.json` in the
 * configuration directory. A missing file is created with the defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     *
     * Creates the directory if it does not exist.
     *
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Default configuration directory: $SNMPLINK_CONFIG_DIR, else
     * $XDG_CONFIG_HOME/snmplink, else ~/.config/snmplink.
     */
    static std::filesystem::path defaultConfigDir();

private:
    nlohmann::json toJson() const;
    /// Applies the settings in `j`; leaves the configuration untouched and
    /// returns false when a value is out of range.
    bool fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace snmplink::infra
