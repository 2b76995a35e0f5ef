#pragma once

#include "core/services/IUdpTransport.hpp"
#include "core/types/SnmpTypes.hpp"
#include "infrastructure/snmp/SnmpMessage.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace snmplink::test {

/**
 * @brief In-memory SNMP agent behind the transport interface.
 *
 * Decodes each request, answers it from a value table and runs the answer
 * through the caller's response filter, like a datagram arriving on a socket.
 */
class FakeAgent : public core::IUdpTransport {
public:
    static constexpr const char* TIMEOUT_TEXT = "No SNMP response received before timeout";

    explicit FakeAgent(std::string community = "public") : community_(std::move(community)) {}

    void setValue(const std::string& oid, core::SnmpValue value) {
        values_[core::ObjectIdentifier::fromString(oid)] = std::move(value);
    }

    std::optional<core::SnmpValue> value(const std::string& oid) const {
        auto it = values_.find(core::ObjectIdentifier::fromString(oid));
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    void setReadOnly(const std::string& oid) {
        readOnly_.insert(core::ObjectIdentifier::fromString(oid));
    }

    /// Makes every exchange time out.
    void setUnreachable(bool unreachable) { unreachable_ = unreachable; }

    /// Sends a response with a foreign request id ahead of every real one.
    void setSendStrayResponses(bool stray) { stray_ = stray; }

    /// Forces a non-zero error status on every response.
    void setForcedErrorStatus(std::optional<core::SnmpErrorStatus> status) {
        forcedStatus_ = status;
    }

    /// Answers GET requests with this OID in the binding instead of the requested one.
    void setAnswerOid(std::optional<std::string> oid) {
        answerOid_ = oid ? std::optional<core::ObjectIdentifier>(
                               core::ObjectIdentifier::fromString(*oid))
                         : std::nullopt;
    }

    int exchangeCount() const { return exchanges_; }
    int rejectedCount() const { return rejected_; }
    const std::optional<infra::SnmpMessage>& lastRequest() const { return lastRequest_; }
    std::string lastHost() const { return lastHost_; }
    uint16_t lastPort() const { return lastPort_; }

    core::TransportReply exchange(const std::string& host,
                                  uint16_t port,
                                  const std::vector<uint8_t>& request,
                                  const core::TransportOptions&,
                                  const ResponseFilter& accept) override {
        ++exchanges_;
        lastHost_ = host;
        lastPort_ = port;

        core::TransportReply reply;

        auto message = infra::decodeMessage(request);
        lastRequest_ = message;

        // Real agents stay silent for a wrong community
        if (unreachable_ || message.community != community_) {
            reply.errorIndication = TIMEOUT_TEXT;
            return reply;
        }

        if (stray_) {
            auto stray = answer(message);
            stray.pdu.requestId += 1;
            auto datagram = infra::encodeMessage(stray);
            if (accept && !accept(datagram)) {
                ++rejected_;
            }
        }

        auto datagram = infra::encodeMessage(answer(message));
        if (accept && !accept(datagram)) {
            ++rejected_;
            reply.errorIndication = TIMEOUT_TEXT;
            return reply;
        }

        reply.payload = std::move(datagram);
        return reply;
    }

private:
    infra::SnmpMessage answer(const infra::SnmpMessage& request) {
        infra::SnmpMessage response = request;
        response.pdu.type = infra::PduType::GetResponse;

        if (forcedStatus_) {
            response.pdu.errorStatus = static_cast<int32_t>(*forcedStatus_);
            response.pdu.errorIndex = 1;
            return response;
        }

        bool v1 = request.version == core::SnmpVersion::V1;
        for (size_t i = 0; i < response.pdu.varbinds.size(); ++i) {
            auto& vb = response.pdu.varbinds[i];
            auto index = static_cast<int32_t>(i + 1);

            if (request.pdu.type == infra::PduType::SetRequest) {
                if (readOnly_.count(vb.oid) != 0) {
                    response.pdu.errorStatus = static_cast<int32_t>(
                        v1 ? core::SnmpErrorStatus::NoSuchName : core::SnmpErrorStatus::NotWritable);
                    response.pdu.errorIndex = index;
                    response.pdu.varbinds = request.pdu.varbinds;
                    return response;
                }
                values_[vb.oid] = vb.value;
                continue;
            }

            auto it = values_.find(vb.oid);
            if (it != values_.end()) {
                vb.value = it->second;
            } else if (v1) {
                response.pdu.errorStatus = static_cast<int32_t>(core::SnmpErrorStatus::NoSuchName);
                response.pdu.errorIndex = index;
                response.pdu.varbinds = request.pdu.varbinds;
                return response;
            } else {
                vb.value = core::NoSuchObject{};
            }
            if (answerOid_) {
                vb.oid = *answerOid_;
            }
        }
        return response;
    }

    std::string community_;
    std::map<core::ObjectIdentifier, core::SnmpValue> values_;
    std::set<core::ObjectIdentifier> readOnly_;
    bool unreachable_{false};
    bool stray_{false};
    std::optional<core::SnmpErrorStatus> forcedStatus_;
    std::optional<core::ObjectIdentifier> answerOid_;

    int exchanges_{0};
    int rejected_{0};
    std::optional<infra::SnmpMessage> lastRequest_;
    std::string lastHost_;
    uint16_t lastPort_{0};
};

} // namespace snmplink::test
