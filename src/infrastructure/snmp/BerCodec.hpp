#pragma once

#include "core/types/SnmpValue.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmplink::infra {

// ASN.1/BER tag types
constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

/**
 * @brief Bounds-checked cursor over BER encoded data.
 *
 * Every read validates tag and length against the remaining input and throws
 * core::FormatError on truncated or malformed data.
 */
class BerReader {
public:
    /// One decoded tag-length-value element; data points into the source buffer.
    struct Tlv {
        uint8_t tag{0};
        const uint8_t* data{nullptr};
        size_t length{0};
    };

    BerReader(const uint8_t* data, size_t size);
    explicit BerReader(const std::vector<uint8_t>& buffer);

    [[nodiscard]] bool atEnd() const { return offset_ >= size_; }

    /// Reads the next element, whatever its tag.
    Tlv read();

    /// Reads the next element and checks its tag; `what` names it in errors.
    Tlv expect(uint8_t tag, const char* what);

    /// Reads a constructed element and returns a reader over its content.
    BerReader enter(uint8_t tag, const char* what);

private:
    size_t decodeLength();

    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

/**
 * @brief BER/ASN.1 encoding helpers and SNMP value codec.
 */
class BerCodec {
public:
    // BER encoding helpers
    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeInteger(int64_t value, uint8_t tag = TAG_INTEGER);
    static std::vector<uint8_t> encodeUnsigned(uint64_t value, uint8_t tag);
    static std::vector<uint8_t> encodeOctetString(const std::string& str,
                                                  uint8_t tag = TAG_OCTET_STRING);
    static std::vector<uint8_t> encodeOid(const std::vector<uint32_t>& components);
    static std::vector<uint8_t> encodeNull(uint8_t tag = TAG_NULL);
    static std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content,
                                               uint8_t tag = TAG_SEQUENCE);

    // BER decoding helpers
    static int64_t decodeInteger(const uint8_t* data, size_t length);
    static uint64_t decodeUnsigned(const uint8_t* data, size_t length);
    static std::vector<uint32_t> decodeOid(const uint8_t* data, size_t length);

    /**
     * @brief Wire tag of a value type.
     */
    static uint8_t tagOf(core::SnmpValueType type);

    /**
     * @brief Encodes a value as a complete TLV.
     */
    static std::vector<uint8_t> encodeValue(const core::SnmpValue& value);

    /**
     * @brief Decodes one value element.
     *
     * With an expected type the wire tag must match that type and the result is
     * exactly that alternative; null-like tags are accepted for any expected type.
     * Without an expected type the default alternative for the tag is produced
     * (INTEGER for 0x02, Gauge32 for 0x42).
     *
     * @throws core::FormatError on a tag mismatch, unknown tag or bad content.
     */
    static core::SnmpValue decodeValue(const BerReader::Tlv& tlv,
                                       std::optional<core::SnmpValueType> expected = std::nullopt);

    /**
     * @brief Decodes a complete value TLV held in a buffer.
     */
    static core::SnmpValue decodeValue(const std::vector<uint8_t>& encoded,
                                       std::optional<core::SnmpValueType> expected = std::nullopt);
};

} // namespace snmplink::infra
