#include "infrastructure/snmp/SnmpMessage.hpp"

#include "core/types/SnmpErrors.hpp"
#include "infrastructure/snmp/BerCodec.hpp"

#include <cstdint>

namespace snmplink::infra {

namespace {

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

int32_t readInt32(BerReader& reader, const char* what) {
    auto tlv = reader.expect(TAG_INTEGER, what);
    auto value = BerCodec::decodeInteger(tlv.data, tlv.length);
    if (value < INT32_MIN || value > INT32_MAX) {
        throw core::FormatError(std::string(what) + " exceeds 32 bits");
    }
    return static_cast<int32_t>(value);
}

bool isKnownPduType(uint8_t tag) {
    return tag == static_cast<uint8_t>(PduType::GetRequest) ||
           tag == static_cast<uint8_t>(PduType::GetNextRequest) ||
           tag == static_cast<uint8_t>(PduType::GetResponse) ||
           tag == static_cast<uint8_t>(PduType::SetRequest);
}

} // namespace

std::string pduTypeToString(PduType type) {
    switch (type) {
        case PduType::GetRequest: return "GetRequest";
        case PduType::GetNextRequest: return "GetNextRequest";
        case PduType::GetResponse: return "GetResponse";
        case PduType::SetRequest: return "SetRequest";
    }
    return "Unknown";
}

std::vector<uint8_t> encodeMessage(const SnmpMessage& message) {
    // Build varbind list
    std::vector<uint8_t> varbindList;
    for (const auto& vb : message.pdu.varbinds) {
        std::vector<uint8_t> varbind;
        append(varbind, BerCodec::encodeOid(vb.oid.components));
        append(varbind, BerCodec::encodeValue(vb.value));
        append(varbindList, BerCodec::encodeSequence(varbind));
    }

    // Build PDU
    std::vector<uint8_t> pduContent;
    append(pduContent, BerCodec::encodeInteger(message.pdu.requestId));
    append(pduContent, BerCodec::encodeInteger(message.pdu.errorStatus));
    append(pduContent, BerCodec::encodeInteger(message.pdu.errorIndex));
    append(pduContent, BerCodec::encodeSequence(varbindList));

    // Build message
    std::vector<uint8_t> msgContent;
    append(msgContent, BerCodec::encodeInteger(static_cast<int>(message.version)));
    append(msgContent, BerCodec::encodeOctetString(message.community));
    append(msgContent,
           BerCodec::encodeSequence(pduContent, static_cast<uint8_t>(message.pdu.type)));

    return BerCodec::encodeSequence(msgContent);
}

SnmpMessage decodeMessage(const std::vector<uint8_t>& datagram) {
    SnmpMessage message;

    BerReader top(datagram);
    auto msg = top.enter(TAG_SEQUENCE, "SEQUENCE");

    // Version
    int32_t version = readInt32(msg, "INTEGER for version");
    if (version == static_cast<int>(core::SnmpVersion::V1)) {
        message.version = core::SnmpVersion::V1;
    } else if (version == static_cast<int>(core::SnmpVersion::V2c)) {
        message.version = core::SnmpVersion::V2c;
    } else {
        throw core::FormatError("Unsupported SNMP version " + std::to_string(version));
    }

    // Community
    auto community = msg.expect(TAG_OCTET_STRING, "OCTET STRING for community");
    message.community.assign(reinterpret_cast<const char*>(community.data), community.length);

    // PDU
    auto pduTlv = msg.read();
    if (!isKnownPduType(pduTlv.tag)) {
        throw core::FormatError("Unsupported PDU type " + std::to_string(pduTlv.tag));
    }
    message.pdu.type = static_cast<PduType>(pduTlv.tag);

    BerReader pdu(pduTlv.data, pduTlv.length);
    message.pdu.requestId = readInt32(pdu, "INTEGER for request-id");
    message.pdu.errorStatus = readInt32(pdu, "INTEGER for error-status");
    message.pdu.errorIndex = readInt32(pdu, "INTEGER for error-index");

    // VarBind list
    auto varbindList = pdu.enter(TAG_SEQUENCE, "SEQUENCE for varbind-list");
    while (!varbindList.atEnd()) {
        auto varbind = varbindList.enter(TAG_SEQUENCE, "SEQUENCE for varbind");

        auto oidTlv = varbind.expect(TAG_OID, "OID");
        core::VarBind vb;
        vb.oid = core::ObjectIdentifier(BerCodec::decodeOid(oidTlv.data, oidTlv.length));
        vb.value = BerCodec::decodeValue(varbind.read());

        message.pdu.varbinds.push_back(std::move(vb));
    }

    return message;
}

} // namespace snmplink::infra
