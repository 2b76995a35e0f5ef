#pragma once

#include "core/services/IMibLookup.hpp"
#include "core/services/IUdpTransport.hpp"
#include "core/types/SnmpTypes.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace snmplink::infra {

/**
 * @brief Connection parameters for one SNMP agent.
 *
 * Holds the target host and port, the community string, the protocol
 * version, the timeout/retry policy and shared handles to the MIB lookup
 * service and the transport. A session starts unconfigured; requests fail
 * with core::NotConfiguredError until setHost() is called.
 *
 * @note Not safe for concurrent mutation. The MIB lookup and transport
 * handles may be shared with other sessions.
 */
class SnmpSession {
public:
    static constexpr uint16_t DEFAULT_PORT = 161;
    static constexpr const char* DEFAULT_COMMUNITY = "public";

    /**
     * @brief Constructs a session using the given collaborators.
     * @param mib MIB lookup service used for OID resolution and value types.
     * @param transport Datagram transport used for requests.
     */
    SnmpSession(std::shared_ptr<core::IMibLookup> mib,
                std::shared_ptr<core::IUdpTransport> transport);

    /**
     * @brief Sets the agent address.
     * @param host Hostname or IP address.
     * @param port UDP port, 161 by default.
     */
    void setHost(const std::string& host, uint16_t port = DEFAULT_PORT);

    void setCommunityString(const std::string& community);
    void setVersion(core::SnmpVersion version);
    void setTimeout(std::chrono::milliseconds timeout);
    void setRetries(int retries);

    /**
     * @brief Appends a directory to the MIB search path.
     *
     * The path is validated before the search path is touched, so a failure
     * leaves it unchanged.
     *
     * @param path Directory holding pre-compiled MIB modules.
     * @throws core::PathNotFoundError if the directory does not exist or cannot be read.
     */
    void addMibSearchPath(const std::filesystem::path& path);

    /**
     * @brief Loads MIB modules eagerly.
     * @param names Module names, or empty to load every available module.
     */
    void preloadMibs(const std::vector<std::string>& names = {});

    /**
     * @brief Throws unless a host has been set.
     * @throws core::NotConfiguredError
     */
    void requireConfigured() const;

    [[nodiscard]] bool isConfigured() const { return !host_.empty(); }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] const std::string& community() const { return community_; }
    [[nodiscard]] core::SnmpVersion version() const { return version_; }
    [[nodiscard]] const core::TransportOptions& transportOptions() const { return options_; }
    [[nodiscard]] std::vector<std::filesystem::path> mibSearchPath() const;

    core::IMibLookup& mib() const { return *mib_; }
    core::IUdpTransport& transport() const { return *transport_; }
    const std::shared_ptr<core::IMibLookup>& mibHandle() const { return mib_; }

private:
    std::shared_ptr<core::IMibLookup> mib_;
    std::shared_ptr<core::IUdpTransport> transport_;

    std::string host_;
    uint16_t port_{DEFAULT_PORT};
    std::string community_{DEFAULT_COMMUNITY};
    core::SnmpVersion version_{core::SnmpVersion::V2c};
    core::TransportOptions options_;
};

} // namespace snmplink::infra
