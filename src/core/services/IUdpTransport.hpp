/**
 * @file IUdpTransport.hpp
 * @brief Interface for the datagram exchange used by the request engine.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace snmplink::core {

/**
 * @brief Timeout and retry policy for one exchange.
 */
struct TransportOptions {
    std::chrono::milliseconds timeout{1000}; ///< Wait per try
    int retries{5};                          ///< Re-sends after the first try

    bool operator==(const TransportOptions& other) const = default;
};

/**
 * @brief Outcome of one exchange: a payload or an error indication.
 */
struct TransportReply {
    std::vector<uint8_t> payload;               ///< Accepted response datagram
    std::optional<std::string> errorIndication; ///< Set when no response was obtained

    [[nodiscard]] bool ok() const { return !errorIndication.has_value(); }
};

/**
 * @brief Interface for request/response datagram exchanges.
 */
class IUdpTransport {
public:
    /**
     * @brief Decides whether a received datagram answers the pending request.
     *
     * Datagrams the filter rejects are dropped and the wait continues.
     */
    using ResponseFilter = std::function<bool(const std::vector<uint8_t>&)>;

    virtual ~IUdpTransport() = default;

    /**
     * @brief Sends a request and waits for an accepted response.
     * @param host Hostname or IP address of the agent.
     * @param port UDP port of the agent.
     * @param request Encoded request datagram.
     * @param options Timeout and retry policy.
     * @param accept Filter for candidate responses; an empty filter accepts anything.
     * @return The accepted payload, or an error indication on timeout or failure.
     */
    virtual TransportReply exchange(const std::string& host,
                                    uint16_t port,
                                    const std::vector<uint8_t>& request,
                                    const TransportOptions& options,
                                    const ResponseFilter& accept) = 0;
};

} // namespace snmplink::core
