#include "app/Application.hpp"

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/network/UdpTransport.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <stdexcept>

namespace po = boost::program_options;

namespace snmplink::app {

namespace {

constexpr const char* LOGGER_NAME = "snmplink";

// Malformed command line, reported with exit code 2
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using TypedSetter = void (infra::SnmpService::*)(const std::string&, std::string_view);

const std::map<core::SnmpValueType, TypedSetter>& typedSetters() {
    static const std::map<core::SnmpValueType, TypedSetter> setters = {
        {core::SnmpValueType::OctetString, &infra::SnmpService::setOctetString},
        {core::SnmpValueType::Integer, &infra::SnmpService::setInteger},
        {core::SnmpValueType::Integer32, &infra::SnmpService::setInteger32},
        {core::SnmpValueType::Counter32, &infra::SnmpService::setCounter32},
        {core::SnmpValueType::Counter64, &infra::SnmpService::setCounter64},
        {core::SnmpValueType::Gauge32, &infra::SnmpService::setGauge32},
        {core::SnmpValueType::Unsigned32, &infra::SnmpService::setUnsigned32},
        {core::SnmpValueType::TimeTicks, &infra::SnmpService::setTimeTicks},
    };
    return setters;
}

core::SnmpValueType parseTypeName(const std::string& name) {
    auto type = core::snmpValueTypeFromString(name);
    if (!type) {
        throw UsageError("Unknown SNMP type \"" + name + "\"");
    }
    return *type;
}

void expectArguments(const std::vector<std::string>& commands, size_t count,
                     const std::string& synopsis) {
    if (commands.size() != count + 1) {
        throw UsageError("Usage: snmplink [options] " + synopsis);
    }
}

} // namespace

Application::Application(std::vector<std::string> args,
                         std::ostream& out,
                         std::shared_ptr<core::IUdpTransport> transport)
    : args_(std::move(args)), out_(out), options_("Options"), transport_(std::move(transport)) {
    options_.add_options()
        ("help,h", "produce help message")
        ("verbose,v", "log debug output")
        ("config-dir", po::value<std::string>()->default_value(
                           infra::ConfigManager::defaultConfigDir().string()),
         "location of config.json")
        ("host", po::value<std::string>(), "agent hostname or IP address")
        ("port", po::value<int>(), "agent UDP port")
        ("community", po::value<std::string>(), "community string")
        ("version", po::value<std::string>(), "protocol version (v1 or v2c)")
        ("timeout", po::value<int>(), "timeout per try in milliseconds")
        ("retries", po::value<int>(), "number of re-sends after the first try")
        ("mib-path", po::value<std::vector<std::string>>()->composing(),
         "directory with pre-compiled MIB modules (repeatable)")
        ("preload", po::value<std::vector<std::string>>()->composing(),
         "MIB module to load at startup (repeatable)")
        ("commands", po::value<std::vector<std::string>>(), "command and arguments");
}

int Application::run() {
    try {
        po::positional_options_description positional;
        positional.add("commands", -1);
        po::store(po::command_line_parser(args_).options(options_).positional(positional).run(),
                  vm_);
        po::notify(vm_);
    } catch (const po::error& e) {
        std::cerr << "snmplink: " << e.what() << "\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (vm_.count("help") != 0) {
        printUsage(out_);
        return EXIT_OK;
    }

    std::vector<std::string> commands;
    if (vm_.count("commands") != 0) {
        commands = vm_["commands"].as<std::vector<std::string>>();
    }
    if (commands.empty()) {
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    initializeLogging();

    try {
        return dispatch(commands);
    } catch (const UsageError& e) {
        std::cerr << "snmplink: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const core::SnmpError& e) {
        spdlog::error("{}", e.what());
        return EXIT_SNMP_ERROR;
    }
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, consoleSink);
    logger->set_level(vm_.count("verbose") != 0 ? spdlog::level::debug : spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void Application::applyLoggingConfig() {
    const auto& cfg = config_->config();
    auto logger = spdlog::default_logger();

    if (vm_.count("verbose") == 0) {
        auto level = spdlog::level::from_str(cfg.logLevel);
        if (level == spdlog::level::off && cfg.logLevel != "off") {
            spdlog::warn("Unknown log level \"{}\" in configuration", cfg.logLevel);
        } else {
            logger->set_level(level);
        }
    }

    if (!cfg.logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logFile, 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            logger->sinks().push_back(fileSink);
            spdlog::debug("Log file: {}", cfg.logFile);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", cfg.logFile, e.what());
        }
    }
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(vm_["config-dir"].as<std::string>());
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }
    applyLoggingConfig();

    auto& cfg = config_->config();

    // Command line overrides
    if (vm_.count("host") != 0) cfg.host = vm_["host"].as<std::string>();
    if (vm_.count("community") != 0) cfg.community = vm_["community"].as<std::string>();
    if (vm_.count("timeout") != 0) cfg.timeoutMs = vm_["timeout"].as<int>();
    if (vm_.count("retries") != 0) cfg.retries = vm_["retries"].as<int>();
    if (vm_.count("port") != 0) {
        auto port = vm_["port"].as<int>();
        if (port < 1 || port > 65535) {
            throw UsageError("Port must be between 1 and 65535");
        }
        cfg.port = static_cast<uint16_t>(port);
    }
    if (vm_.count("version") != 0) {
        auto version = vm_["version"].as<std::string>();
        if (version != "v1" && version != "1" && version != "v2c" && version != "2c") {
            throw UsageError("Unsupported SNMP version \"" + version + "\"");
        }
        cfg.version = core::snmpVersionFromString(version);
    }
    if (cfg.timeoutMs <= 0 || cfg.retries < 0) {
        throw UsageError("Timeout must be positive and retries must not be negative");
    }

    // SNMP services
    mib_ = std::make_shared<infra::MibStore>();
    if (!transport_) {
        transport_ = std::make_shared<infra::UdpTransport>();
    }
    session_ = std::make_unique<infra::SnmpSession>(mib_, transport_);

    if (!cfg.host.empty()) {
        session_->setHost(cfg.host, cfg.port);
    }
    session_->setCommunityString(cfg.community);
    session_->setVersion(cfg.version);
    session_->setTimeout(std::chrono::milliseconds(cfg.timeoutMs));
    session_->setRetries(cfg.retries);

    auto mibPaths = cfg.mibSearchPaths;
    if (vm_.count("mib-path") != 0) {
        for (const auto& path : vm_["mib-path"].as<std::vector<std::string>>()) {
            mibPaths.push_back(path);
        }
    }
    for (const auto& path : mibPaths) {
        session_->addMibSearchPath(path);
    }

    auto preload = cfg.preloadMibs;
    if (vm_.count("preload") != 0) {
        for (const auto& name : vm_["preload"].as<std::vector<std::string>>()) {
            preload.push_back(name);
        }
    }
    if (!preload.empty()) {
        session_->preloadMibs(preload);
    }

    service_ = std::make_unique<infra::SnmpService>(*session_);
}

int Application::dispatch(const std::vector<std::string>& commands) {
    const auto& command = commands.front();

    if (command.rfind("convert-", 0) == 0) {
        return runConvert(command.substr(8), commands);
    }

    initializeComponents();

    if (command == "get") {
        return runGet(commands);
    }
    if (command == "set") {
        return runSet(commands);
    }
    if (command.rfind("set-", 0) == 0) {
        return runTypedSet(command.substr(4), commands);
    }

    throw UsageError("Unknown command \"" + command + "\"");
}

int Application::runGet(const std::vector<std::string>& commands) {
    expectArguments(commands, 1, "get OID");

    const auto& oid = commands[1];
    auto value = service_->get(oid);
    out_ << oid << " = " << core::snmpValueTypeToString(core::typeOf(value)) << ": "
         << core::toString(value) << "\n";
    return EXIT_OK;
}

int Application::runSet(const std::vector<std::string>& commands) {
    expectArguments(commands, 2, "set OID VALUE");

    service_->set(commands[1], commands[2]);
    return EXIT_OK;
}

int Application::runTypedSet(const std::string& type, const std::vector<std::string>& commands) {
    expectArguments(commands, 2, "set-" + type + " OID VALUE");

    auto valueType = parseTypeName(type);
    auto it = typedSetters().find(valueType);
    if (it == typedSetters().end()) {
        throw UsageError("Values of type " + core::snmpValueTypeToString(valueType) +
                         " cannot be set with set-<type>");
    }

    (service_.get()->*(it->second))(commands[1], commands[2]);
    return EXIT_OK;
}

int Application::runConvert(const std::string& type, const std::vector<std::string>& commands) {
    expectArguments(commands, 1, "convert-" + type + " VALUE");

    auto value = core::convertTo(parseTypeName(type), commands[1]);
    out_ << core::snmpValueTypeToString(core::typeOf(value)) << ": " << core::toString(value)
         << "\n";
    return EXIT_OK;
}

void Application::printUsage(std::ostream& os) const {
    os << "Usage:\n"
       << "  snmplink [options] get OID\n"
       << "  snmplink [options] set OID VALUE\n"
       << "  snmplink [options] set-<type> OID VALUE\n"
       << "  snmplink convert-<type> VALUE\n\n"
       << "Types: octet-string, integer, integer32, counter32, counter64, gauge32,\n"
       << "       unsigned32, timeticks (convert also takes ipaddress and oid)\n\n"
       << options_ << "\n";
}

} // namespace snmplink::app
