#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <utility>

namespace snmplink::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* dir = std::getenv("SNMPLINK_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "snmplink";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "snmplink";
    }
    return std::filesystem::current_path() / ".snmplink";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        if (!fromJson(j)) {
            return false;
        }

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Agent
    j["agent"]["host"] = config_.host;
    j["agent"]["port"] = config_.port;
    j["agent"]["community"] = config_.community;
    j["agent"]["version"] = core::snmpVersionToString(config_.version);

    // Transport
    j["transport"]["timeout_ms"] = config_.timeoutMs;
    j["transport"]["retries"] = config_.retries;

    // MIB
    j["mib"]["search_paths"] = config_.mibSearchPaths;
    j["mib"]["preload"] = config_.preloadMibs;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

bool ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config = config_;

    // Agent
    if (j.contains("agent")) {
        const auto& a = j["agent"];
        config.host = a.value("host", "");
        int port = a.value("port", 161);
        if (port < 1 || port > 65535) {
            spdlog::error("Failed to load config: agent port {} is not in 1..65535", port);
            return false;
        }
        config.port = static_cast<uint16_t>(port);
        config.community = a.value("community", "public");
        config.version = core::snmpVersionFromString(a.value("version", "v2c"));
    }

    // Transport
    if (j.contains("transport")) {
        const auto& t = j["transport"];
        config.timeoutMs = t.value("timeout_ms", 1000);
        config.retries = t.value("retries", 5);
    }

    // MIB
    if (j.contains("mib")) {
        const auto& m = j["mib"];
        config.mibSearchPaths = m.value("search_paths", std::vector<std::string>{});
        config.preloadMibs = m.value("preload", std::vector<std::string>{});
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logLevel = l.value("level", "warn");
        config.logFile = l.value("file", "");
    }

    config_ = std::move(config);
    return true;
}

} // namespace snmplink::infra
