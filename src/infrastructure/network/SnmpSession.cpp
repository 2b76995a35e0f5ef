#include "infrastructure/network/SnmpSession.hpp"

#include "core/types/SnmpErrors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace snmplink::infra {

namespace {

std::string joinPaths(const std::vector<std::filesystem::path>& paths) {
    std::string joined;
    for (const auto& path : paths) {
        if (!joined.empty()) joined += ", ";
        joined += path.string();
    }
    return joined;
}

} // namespace

SnmpSession::SnmpSession(std::shared_ptr<core::IMibLookup> mib,
                         std::shared_ptr<core::IUdpTransport> transport)
    : mib_(std::move(mib)), transport_(std::move(transport)) {
    if (!mib_ || !transport_) {
        throw std::invalid_argument("SnmpSession requires a MIB lookup and a transport");
    }
}

void SnmpSession::setHost(const std::string& host, uint16_t port) {
    host_ = host;
    port_ = port;
    spdlog::debug("SNMP agent set to {}:{}", host_, port_);
}

void SnmpSession::setCommunityString(const std::string& community) {
    community_ = community;
}

void SnmpSession::setVersion(core::SnmpVersion version) {
    version_ = version;
}

void SnmpSession::setTimeout(std::chrono::milliseconds timeout) {
    options_.timeout = timeout;
}

void SnmpSession::setRetries(int retries) {
    options_.retries = retries;
}

void SnmpSession::addMibSearchPath(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        throw core::PathNotFoundError(path);
    }

    // Opening the directory proves it is readable
    std::filesystem::directory_iterator entries(path, ec);
    if (ec) {
        throw core::PathNotFoundError(path);
    }

    spdlog::info("Adding MIB path {}", path.string());

    mib_->appendSearchPath(path);

    spdlog::debug("New paths: {}", joinPaths(mib_->searchPath()));
}

void SnmpSession::preloadMibs(const std::vector<std::string>& names) {
    if (!names.empty()) {
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) joined += " ";
            joined += name;
        }
        spdlog::info("Preloading MIBs {}", joined);
    } else {
        spdlog::info("Preloading all available MIBs");
    }
    mib_->loadModules(names);
}

void SnmpSession::requireConfigured() const {
    if (host_.empty()) {
        throw core::NotConfiguredError("No host set");
    }
}

std::vector<std::filesystem::path> SnmpSession::mibSearchPath() const {
    return mib_->searchPath();
}

} // namespace snmplink::infra
