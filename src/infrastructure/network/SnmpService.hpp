#pragma once

#include "core/services/ISnmpService.hpp"
#include "core/types/SnmpTypes.hpp"
#include "infrastructure/network/SnmpSession.hpp"
#include "infrastructure/snmp/SnmpMessage.hpp"

#include <atomic>
#include <string_view>

namespace snmplink::infra {

/**
 * @brief SNMP request engine for one session.
 *
 * Resolves OID expressions through the session's MIB lookup service, builds
 * v1/v2c request messages, drives the exchange through the session's
 * transport and turns the response into a value or a typed error.
 *
 * @note This class is non-copyable. The session must outlive the service.
 */
class SnmpService : public core::ISnmpService {
public:
    /**
     * @brief Constructs a request engine bound to a session.
     * @param session Connection parameters and collaborators.
     */
    explicit SnmpService(SnmpSession& session);

    ~SnmpService() override = default;

    SnmpService(const SnmpService&) = delete;
    SnmpService& operator=(const SnmpService&) = delete;

    core::SnmpValue get(const std::string& oid) override;

    void set(const std::string& oid, const core::SnmpValue& value) override;

    void set(const std::string& oid, const std::string& raw) override;

    /** @name Typed SET helpers
     *  Convert the raw text to the named type, then set it.
     *  @throws core::RangeError or core::FormatError from the conversion.
     *  @{ */
    void setOctetString(const std::string& oid, std::string_view raw);
    void setInteger(const std::string& oid, std::string_view raw);
    void setInteger32(const std::string& oid, std::string_view raw);
    void setCounter32(const std::string& oid, std::string_view raw);
    void setCounter64(const std::string& oid, std::string_view raw);
    void setGauge32(const std::string& oid, std::string_view raw);
    void setUnsigned32(const std::string& oid, std::string_view raw);
    void setTimeTicks(const std::string& oid, std::string_view raw);
    /** @} */

    SnmpSession& session() { return session_; }

private:
    void setResolved(const core::ObjectIdentifier& oid, const core::SnmpValue& value);

    // One request/response exchange; transport failures come back as an
    // error indication in the outcome
    core::RequestOutcome performRequest(PduType type, const core::VarBind& varbind);

    int32_t nextRequestId();

    SnmpSession& session_;
    std::atomic<int32_t> requestIdCounter_;
};

} // namespace snmplink::infra
