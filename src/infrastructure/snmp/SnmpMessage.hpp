#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace snmplink::infra {

// SNMP PDU types
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2,
    SetRequest = 0xA3
};

std::string pduTypeToString(PduType type);

/**
 * @brief SNMPv1/v2c protocol data unit.
 */
struct SnmpPdu {
    PduType type{PduType::GetRequest};
    int32_t requestId{0};
    int32_t errorStatus{0};
    int32_t errorIndex{0};
    std::vector<core::VarBind> varbinds;

    bool operator==(const SnmpPdu& other) const = default;
};

/**
 * @brief Community-based SNMP message.
 *
 * Wire layout:
 *   SEQUENCE { INTEGER version, OCTET STRING community, PDU }
 *   PDU ::= [type] { INTEGER request-id, INTEGER error-status,
 *                    INTEGER error-index, SEQUENCE OF SEQUENCE { OID, value } }
 */
struct SnmpMessage {
    core::SnmpVersion version{core::SnmpVersion::V2c};
    std::string community{"public"};
    SnmpPdu pdu;

    bool operator==(const SnmpMessage& other) const = default;
};

/**
 * @brief Encodes a message into a datagram.
 * @throws core::FormatError if a variable binding cannot be encoded.
 */
std::vector<uint8_t> encodeMessage(const SnmpMessage& message);

/**
 * @brief Decodes a datagram into a message.
 * @throws core::FormatError on malformed, truncated or unsupported input.
 */
SnmpMessage decodeMessage(const std::vector<uint8_t>& datagram);

} // namespace snmplink::infra
