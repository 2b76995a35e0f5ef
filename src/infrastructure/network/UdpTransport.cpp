#include "infrastructure/network/UdpTransport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace snmplink::infra {

namespace {

using Clock = std::chrono::steady_clock;

// Waits for one datagram until the deadline. Returns its size, or
// std::nullopt when the deadline passed first.
std::optional<size_t> receiveUntil(asio::io_context& context,
                                   asio::ip::udp::socket& socket,
                                   std::vector<uint8_t>& buffer,
                                   Clock::time_point deadline) {
    auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return std::nullopt;
    }

    asio::error_code ec = asio::error::would_block;
    size_t length = 0;
    asio::ip::udp::endpoint sender;

    socket.async_receive_from(asio::buffer(buffer), sender,
                              [&](const asio::error_code& error, size_t bytes) {
                                  ec = error;
                                  length = bytes;
                              });

    context.restart();
    context.run_for(std::chrono::duration_cast<std::chrono::milliseconds>(remaining));

    // Deadline reached with the receive still pending
    if (!context.stopped()) {
        socket.cancel();
        context.run();
    }

    if (ec == asio::error::operation_aborted || ec == asio::error::would_block) {
        return std::nullopt;
    }
    if (ec) {
        throw asio::system_error(ec);
    }

    spdlog::trace("Received {} bytes from {}:{}", length, sender.address().to_string(),
                  sender.port());
    return length;
}

} // namespace

core::TransportReply UdpTransport::exchange(const std::string& host,
                                            uint16_t port,
                                            const std::vector<uint8_t>& request,
                                            const core::TransportOptions& options,
                                            const ResponseFilter& accept) {
    core::TransportReply reply;

    try {
        asio::io_context context;

        // Resolve address
        asio::ip::udp::resolver resolver(context);
        asio::error_code ec;
        auto endpoints = resolver.resolve(asio::ip::udp::v4(), host, std::to_string(port), ec);

        if (ec || endpoints.empty()) {
            reply.errorIndication = "Failed to resolve address: " + host +
                                    (ec ? " (" + ec.message() + ")" : std::string());
            return reply;
        }

        auto endpoint = endpoints.begin()->endpoint();

        // Create UDP socket
        asio::ip::udp::socket socket(context, asio::ip::udp::v4());
        std::vector<uint8_t> recvBuffer(MAX_DATAGRAM_SIZE);

        int tries = 1 + std::max(0, options.retries);
        for (int attempt = 0; attempt < tries; ++attempt) {
            if (attempt > 0) {
                spdlog::debug("Retrying request to {}:{} ({}/{})", host, port, attempt,
                              options.retries);
            }

            socket.send_to(asio::buffer(request), endpoint);
            auto deadline = Clock::now() + options.timeout;

            while (auto received = receiveUntil(context, socket, recvBuffer, deadline)) {
                std::vector<uint8_t> payload(recvBuffer.begin(),
                                             recvBuffer.begin() + static_cast<long>(*received));
                if (!accept || accept(payload)) {
                    reply.payload = std::move(payload);
                    return reply;
                }
                spdlog::debug("Dropping unexpected datagram of {} bytes from {}:{}",
                              *received, host, port);
            }
        }

        reply.errorIndication = TIMEOUT_INDICATION;
    } catch (const asio::system_error& e) {
        reply.errorIndication = std::string("Socket error: ") + e.what();
    }

    return reply;
}

} // namespace snmplink::infra
