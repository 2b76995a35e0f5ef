#pragma once

#include "core/services/IUdpTransport.hpp"

#include <asio.hpp>

namespace snmplink::infra {

/**
 * @brief Blocking UDP request/response exchange over IPv4, built on Asio.
 *
 * Each exchange uses its own io_context and socket, so one transport can be
 * shared by several sessions.
 */
class UdpTransport : public core::IUdpTransport {
public:
    /// Error indication reported when every try timed out.
    static constexpr const char* TIMEOUT_INDICATION = "No SNMP response received before timeout";

    /// Largest datagram accepted from an agent.
    static constexpr size_t MAX_DATAGRAM_SIZE = 65535;

    UdpTransport() = default;
    ~UdpTransport() override = default;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    core::TransportReply exchange(const std::string& host,
                                  uint16_t port,
                                  const std::vector<uint8_t>& request,
                                  const core::TransportOptions& options,
                                  const ResponseFilter& accept) override;
};

} // namespace snmplink::infra
