#include "infrastructure/network/SnmpService.hpp"

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/mib/OidResolver.hpp"
#include "infrastructure/snmp/BerCodec.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <random>

namespace snmplink::infra {

namespace {

int32_t randomRequestId() {
    std::random_device rd;
    std::uniform_int_distribution<int32_t> dist(1, 0x3FFFFFFF);
    return dist(rd);
}

} // namespace

SnmpService::SnmpService(SnmpSession& session)
    : session_(session), requestIdCounter_(randomRequestId()) {}

core::SnmpValue SnmpService::get(const std::string& oid) {
    session_.requireConfigured();

    OidResolver resolver(session_.mibHandle());
    auto resolved = resolver.resolve(oid);

    auto outcome = performRequest(PduType::GetRequest, core::VarBind{resolved, core::Null{}});

    if (outcome.errorIndication) {
        spdlog::warn("SNMP GET {} on {} failed: {}", resolved.toString(), session_.host(),
                     *outcome.errorIndication);
        throw core::TransportError("SNMP GET failed: " + *outcome.errorIndication,
                                   *outcome.errorIndication);
    }

    if (outcome.errorStatus != 0) {
        auto statusText = core::snmpErrorStatusToString(outcome.errorStatus);
        spdlog::warn("SNMP GET {} on {} failed: {} at index {}", resolved.toString(),
                     session_.host(), statusText, outcome.errorIndex);
        throw core::AgentError("SNMP GET failed: " + statusText, outcome.errorStatus, statusText,
                               outcome.errorIndex);
    }

    if (outcome.varbinds.empty()) {
        throw core::ObjectNotFoundError(resolved.toString());
    }

    auto& varbind = outcome.varbinds.front();
    if (varbind.oid != resolved) {
        spdlog::warn("SNMP GET {} on {} answered for {}", resolved.toString(), session_.host(),
                     varbind.oid.toString());
        throw core::FormatError("Response binding " + varbind.oid.toString() +
                                " does not match requested OID " + resolved.toString());
    }
    if (core::isNullLike(varbind.value)) {
        throw core::ObjectNotFoundError(varbind.oid.toString());
    }

    // Tags shared by two types decode to the default one; the MIB settles which
    auto symbol = session_.mib().findByOid(resolved);
    if (symbol && symbol->syntax && *symbol->syntax != core::typeOf(varbind.value) &&
        BerCodec::tagOf(*symbol->syntax) == BerCodec::tagOf(core::typeOf(varbind.value))) {
        varbind.value = BerCodec::decodeValue(BerCodec::encodeValue(varbind.value), *symbol->syntax);
    }

    spdlog::debug("SNMP GET {} = {} ({}, {:.2f} ms)", varbind.oid.toString(),
                  core::toString(varbind.value),
                  core::snmpValueTypeToString(core::typeOf(varbind.value)),
                  outcome.responseTimeMs());
    return varbind.value;
}

void SnmpService::set(const std::string& oid, const core::SnmpValue& value) {
    session_.requireConfigured();

    OidResolver resolver(session_.mibHandle());
    setResolved(resolver.resolve(oid), value);
}

void SnmpService::set(const std::string& oid, const std::string& raw) {
    session_.requireConfigured();

    OidResolver resolver(session_.mibHandle());
    auto resolved = resolver.resolve(oid);

    auto symbol = session_.mib().findByOid(resolved);
    if (!symbol || !symbol->syntax) {
        throw core::FormatError("No MIB type known for OID " + resolved.toString() +
                                ", use a typed set");
    }

    spdlog::debug("Converting \"{}\" to {} as declared by {}::{}", raw,
                  core::snmpValueTypeToString(*symbol->syntax), symbol->module, symbol->name);
    setResolved(resolved, core::convertTo(*symbol->syntax, raw));
}

void SnmpService::setOctetString(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToOctetString(raw)));
}

void SnmpService::setInteger(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToInteger(raw)));
}

void SnmpService::setInteger32(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToInteger32(raw)));
}

void SnmpService::setCounter32(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToCounter32(raw)));
}

void SnmpService::setCounter64(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToCounter64(raw)));
}

void SnmpService::setGauge32(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToGauge32(raw)));
}

void SnmpService::setUnsigned32(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToUnsigned32(raw)));
}

void SnmpService::setTimeTicks(const std::string& oid, std::string_view raw) {
    set(oid, core::SnmpValue(core::convertToTimeTicks(raw)));
}

void SnmpService::setResolved(const core::ObjectIdentifier& oid, const core::SnmpValue& value) {
    if (session_.version() == core::SnmpVersion::V1 &&
        std::holds_alternative<core::Counter64>(value)) {
        throw core::FormatError("Counter64 values cannot be sent with SNMPv1");
    }
    if (core::isNullLike(value)) {
        throw core::FormatError("Cannot set " + oid.toString() + " to a " +
                                core::snmpValueTypeToString(core::typeOf(value)) + " value");
    }

    auto outcome = performRequest(PduType::SetRequest, core::VarBind{oid, value});

    if (outcome.errorIndication) {
        spdlog::warn("SNMP SET {} on {} failed: {}", oid.toString(), session_.host(),
                     *outcome.errorIndication);
        throw core::TransportError("SNMP SET failed: " + *outcome.errorIndication,
                                   *outcome.errorIndication);
    }

    if (outcome.errorStatus != 0) {
        auto statusText = core::snmpErrorStatusToString(outcome.errorStatus);
        spdlog::warn("SNMP SET {} on {} failed: {} at index {}", oid.toString(), session_.host(),
                     statusText, outcome.errorIndex);
        throw core::AgentError("SNMP SET failed: " + statusText, outcome.errorStatus, statusText,
                               outcome.errorIndex);
    }

    spdlog::debug("SNMP SET {} = {} ({:.2f} ms)", oid.toString(), core::toString(value),
                  outcome.responseTimeMs());
}

core::RequestOutcome SnmpService::performRequest(PduType type, const core::VarBind& varbind) {
    SnmpMessage request;
    request.version = session_.version();
    request.community = session_.community();
    request.pdu.type = type;
    request.pdu.requestId = nextRequestId();
    request.pdu.varbinds.push_back(varbind);

    auto packet = encodeMessage(request);

    spdlog::debug("Sending {} request-id {} for {} to {}:{} ({})", pduTypeToString(type),
                  request.pdu.requestId, varbind.oid.toString(), session_.host(),
                  session_.port(), core::snmpVersionToString(request.version));

    // Only a GetResponse to this request, in this session's version, is an answer
    auto accept = [&request](const std::vector<uint8_t>& datagram) {
        try {
            auto message = decodeMessage(datagram);
            if (message.pdu.type != PduType::GetResponse ||
                message.pdu.requestId != request.pdu.requestId ||
                message.version != request.version) {
                spdlog::debug("Ignoring {} with request-id {}", pduTypeToString(message.pdu.type),
                              message.pdu.requestId);
                return false;
            }
            return true;
        } catch (const core::FormatError& e) {
            spdlog::debug("Ignoring malformed datagram: {}", e.what());
            return false;
        }
    };

    core::RequestOutcome outcome;
    auto startTime = std::chrono::steady_clock::now();

    auto reply = session_.transport().exchange(session_.host(), session_.port(), packet,
                                               session_.transportOptions(), accept);

    auto endTime = std::chrono::steady_clock::now();
    outcome.responseTime =
        std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);

    if (!reply.ok()) {
        outcome.errorIndication = reply.errorIndication;
        return outcome;
    }

    auto response = decodeMessage(reply.payload);
    outcome.errorStatus = response.pdu.errorStatus;
    outcome.errorIndex = response.pdu.errorIndex;
    outcome.varbinds = std::move(response.pdu.varbinds);
    return outcome;
}

int32_t SnmpService::nextRequestId() {
    int32_t id = requestIdCounter_++;
    if (id <= 0 || id == std::numeric_limits<int32_t>::max()) {
        requestIdCounter_ = 2;
        return 1;
    }
    return id;
}

} // namespace snmplink::infra
