#include "infrastructure/snmp/BerCodec.hpp"

#include "core/types/SnmpErrors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <type_traits>

namespace snmplink::infra {

namespace {

std::string hexTag(uint8_t tag) {
    std::ostringstream oss;
    oss << "0x" << std::hex << static_cast<int>(tag);
    return oss.str();
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> wrap(uint8_t tag, const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded;
    encoded.push_back(tag);
    append(encoded, BerCodec::encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

void appendBase128(std::vector<uint8_t>& out, uint64_t value) {
    std::vector<uint8_t> subId;
    do {
        subId.insert(subId.begin(), static_cast<uint8_t>(value & 0x7F));
        value >>= 7;
    } while (value > 0);

    // Set high bit on all but last byte
    for (size_t j = 0; j + 1 < subId.size(); ++j) {
        subId[j] |= 0x80;
    }
    append(out, subId);
}

core::SnmpValueType defaultTypeForTag(uint8_t tag) {
    switch (tag) {
        case TAG_INTEGER: return core::SnmpValueType::Integer;
        case TAG_OCTET_STRING: return core::SnmpValueType::OctetString;
        case TAG_NULL: return core::SnmpValueType::Null;
        case TAG_OID: return core::SnmpValueType::ObjectIdentifier;
        case TAG_IP_ADDRESS: return core::SnmpValueType::IpAddress;
        case TAG_COUNTER32: return core::SnmpValueType::Counter32;
        case TAG_GAUGE32: return core::SnmpValueType::Gauge32;
        case TAG_TIMETICKS: return core::SnmpValueType::TimeTicks;
        case TAG_COUNTER64: return core::SnmpValueType::Counter64;
        case TAG_NO_SUCH_OBJECT: return core::SnmpValueType::NoSuchObject;
        case TAG_NO_SUCH_INSTANCE: return core::SnmpValueType::NoSuchInstance;
        case TAG_END_OF_MIB_VIEW: return core::SnmpValueType::EndOfMibView;
        default: break;
    }
    throw core::FormatError("Unsupported value tag " + hexTag(tag));
}

bool isNullLikeTag(uint8_t tag) {
    return tag == TAG_NULL || tag == TAG_NO_SUCH_OBJECT || tag == TAG_NO_SUCH_INSTANCE ||
           tag == TAG_END_OF_MIB_VIEW;
}

int32_t toInt32(int64_t value) {
    if (value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        throw core::FormatError("INTEGER value " + std::to_string(value) + " exceeds 32 bits");
    }
    return static_cast<int32_t>(value);
}

uint32_t toUInt32(uint64_t value) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw core::FormatError("Unsigned value " + std::to_string(value) + " exceeds 32 bits");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

// BerReader

BerReader::BerReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

BerReader::BerReader(const std::vector<uint8_t>& buffer)
    : data_(buffer.data()), size_(buffer.size()) {}

size_t BerReader::decodeLength() {
    if (atEnd()) {
        throw core::FormatError("Truncated length");
    }
    uint8_t first = data_[offset_++];

    if ((first & 0x80) == 0) {
        return first;
    }

    size_t numBytes = first & 0x7F;
    if (numBytes == 0 || numBytes > 4) {
        throw core::FormatError("Unsupported length encoding");
    }
    if (size_ - offset_ < numBytes) {
        throw core::FormatError("Truncated length");
    }

    size_t length = 0;
    for (size_t i = 0; i < numBytes; ++i) {
        length = (length << 8) | data_[offset_++];
    }

    return length;
}

BerReader::Tlv BerReader::read() {
    if (atEnd()) {
        throw core::FormatError("Unexpected end of data");
    }

    Tlv tlv;
    tlv.tag = data_[offset_++];
    tlv.length = decodeLength();
    if (tlv.length > size_ - offset_) {
        throw core::FormatError("Element length " + std::to_string(tlv.length) +
                                " exceeds remaining " + std::to_string(size_ - offset_) +
                                " bytes");
    }
    tlv.data = data_ + offset_;
    offset_ += tlv.length;
    return tlv;
}

BerReader::Tlv BerReader::expect(uint8_t tag, const char* what) {
    auto tlv = read();
    if (tlv.tag != tag) {
        throw core::FormatError(std::string("Expected ") + what + " (tag " + hexTag(tag) +
                                "), got tag " + hexTag(tlv.tag));
    }
    return tlv;
}

BerReader BerReader::enter(uint8_t tag, const char* what) {
    auto tlv = expect(tag, what);
    return BerReader(tlv.data, tlv.length);
}

// BER encoding helpers

std::vector<uint8_t> BerCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    }

    return encoded;
}

std::vector<uint8_t> BerCodec::encodeInteger(int64_t value, uint8_t tag) {
    // Minimal two's complement: stop once the remaining value is pure sign
    // extension of the leading byte.
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (!((value == 0 && !(bytes.front() & 0x80)) ||
               (value == -1 && (bytes.front() & 0x80))));

    return wrap(tag, bytes);
}

std::vector<uint8_t> BerCodec::encodeUnsigned(uint64_t value, uint8_t tag) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);

    // Add leading zero if high bit is set
    if (bytes.front() & 0x80) {
        bytes.insert(bytes.begin(), 0);
    }

    return wrap(tag, bytes);
}

std::vector<uint8_t> BerCodec::encodeOctetString(const std::string& str, uint8_t tag) {
    return wrap(tag, std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> BerCodec::encodeOid(const std::vector<uint32_t>& components) {
    if (components.size() < 2) {
        throw core::FormatError("OID must have at least two components");
    }
    if (components[0] > 2 || (components[0] < 2 && components[1] >= 40)) {
        throw core::FormatError("OID does not start with a valid arc");
    }

    std::vector<uint8_t> oidBytes;

    // First two components are encoded as (first * 40 + second)
    appendBase128(oidBytes, static_cast<uint64_t>(components[0]) * 40 + components[1]);

    // Remaining components use base-128 encoding
    for (size_t i = 2; i < components.size(); ++i) {
        appendBase128(oidBytes, components[i]);
    }

    return wrap(TAG_OID, oidBytes);
}

std::vector<uint8_t> BerCodec::encodeNull(uint8_t tag) {
    return {tag, 0x00};
}

std::vector<uint8_t> BerCodec::encodeSequence(const std::vector<uint8_t>& content, uint8_t tag) {
    return wrap(tag, content);
}

// BER decoding helpers

int64_t BerCodec::decodeInteger(const uint8_t* data, size_t length) {
    if (length == 0 || length > 8) {
        throw core::FormatError("Invalid INTEGER length " + std::to_string(length));
    }

    // Sign extend from the first byte
    uint64_t value = (data[0] & 0x80) ? ~uint64_t{0} : 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }

    return static_cast<int64_t>(value);
}

uint64_t BerCodec::decodeUnsigned(const uint8_t* data, size_t length) {
    if (length == 0 || length > 9 || (length == 9 && data[0] != 0)) {
        throw core::FormatError("Invalid unsigned length " + std::to_string(length));
    }

    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

std::vector<uint32_t> BerCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) {
        throw core::FormatError("Empty OBJECT IDENTIFIER");
    }

    std::vector<uint32_t> components;
    uint64_t value = 0;
    bool pending = false;

    for (size_t i = 0; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        pending = true;
        if (value > std::numeric_limits<uint32_t>::max() + uint64_t{80}) {
            throw core::FormatError("OID sub-identifier exceeds 32 bits");
        }

        if ((data[i] & 0x80) == 0) {
            if (components.empty()) {
                // First sub-identifier encodes the first two components
                uint64_t first = value < 40 ? 0 : (value < 80 ? 1 : 2);
                components.push_back(static_cast<uint32_t>(first));
                components.push_back(toUInt32(value - first * 40));
            } else {
                components.push_back(toUInt32(value));
            }
            value = 0;
            pending = false;
        }
    }

    if (pending) {
        throw core::FormatError("Truncated OID sub-identifier");
    }

    return components;
}

uint8_t BerCodec::tagOf(core::SnmpValueType type) {
    using core::SnmpValueType;
    switch (type) {
        case SnmpValueType::Null: return TAG_NULL;
        case SnmpValueType::OctetString: return TAG_OCTET_STRING;
        case SnmpValueType::Integer:
        case SnmpValueType::Integer32: return TAG_INTEGER;
        case SnmpValueType::Counter32: return TAG_COUNTER32;
        case SnmpValueType::Counter64: return TAG_COUNTER64;
        case SnmpValueType::Gauge32:
        case SnmpValueType::Unsigned32: return TAG_GAUGE32;
        case SnmpValueType::TimeTicks: return TAG_TIMETICKS;
        case SnmpValueType::IpAddress: return TAG_IP_ADDRESS;
        case SnmpValueType::ObjectIdentifier: return TAG_OID;
        case SnmpValueType::NoSuchObject: return TAG_NO_SUCH_OBJECT;
        case SnmpValueType::NoSuchInstance: return TAG_NO_SUCH_INSTANCE;
        case SnmpValueType::EndOfMibView: return TAG_END_OF_MIB_VIEW;
    }
    return TAG_NULL;
}

std::vector<uint8_t> BerCodec::encodeValue(const core::SnmpValue& value) {
    uint8_t tag = tagOf(core::typeOf(value));

    return std::visit(
        [tag](const auto& v) -> std::vector<uint8_t> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, core::OctetString>) {
                return encodeOctetString(v.value, tag);
            } else if constexpr (std::is_same_v<T, core::IpAddress>) {
                return wrap(tag, std::vector<uint8_t>(v.value.begin(), v.value.end()));
            } else if constexpr (std::is_same_v<T, core::ObjectIdentifierValue>) {
                return encodeOid(v.value);
            } else if constexpr (std::is_same_v<T, core::Integer> ||
                                 std::is_same_v<T, core::Integer32>) {
                return encodeInteger(v.value, tag);
            } else if constexpr (std::is_same_v<T, core::Counter32> ||
                                 std::is_same_v<T, core::Counter64> ||
                                 std::is_same_v<T, core::Gauge32> ||
                                 std::is_same_v<T, core::Unsigned32> ||
                                 std::is_same_v<T, core::TimeTicks>) {
                return encodeUnsigned(v.value, tag);
            } else {
                return encodeNull(tag);
            }
        },
        value);
}

core::SnmpValue BerCodec::decodeValue(const BerReader::Tlv& tlv,
                                      std::optional<core::SnmpValueType> expected) {
    using core::SnmpValueType;

    SnmpValueType type;
    if (isNullLikeTag(tlv.tag)) {
        // An agent may answer any typed request with an exception value
        type = defaultTypeForTag(tlv.tag);
    } else if (expected) {
        if (tagOf(*expected) != tlv.tag) {
            throw core::FormatError("Expected " + core::snmpValueTypeToString(*expected) +
                                    " (tag " + hexTag(tagOf(*expected)) + "), got tag " +
                                    hexTag(tlv.tag));
        }
        type = *expected;
    } else {
        type = defaultTypeForTag(tlv.tag);
    }

    const uint8_t* data = tlv.data;
    size_t length = tlv.length;

    switch (type) {
        case SnmpValueType::OctetString:
            return core::OctetString{std::string(reinterpret_cast<const char*>(data), length)};
        case SnmpValueType::Integer:
            return core::Integer{toInt32(decodeInteger(data, length))};
        case SnmpValueType::Integer32:
            return core::Integer32{toInt32(decodeInteger(data, length))};
        case SnmpValueType::Counter32:
            return core::Counter32{toUInt32(decodeUnsigned(data, length))};
        case SnmpValueType::Counter64:
            return core::Counter64{decodeUnsigned(data, length)};
        case SnmpValueType::Gauge32:
            return core::Gauge32{toUInt32(decodeUnsigned(data, length))};
        case SnmpValueType::Unsigned32:
            return core::Unsigned32{toUInt32(decodeUnsigned(data, length))};
        case SnmpValueType::TimeTicks:
            return core::TimeTicks{toUInt32(decodeUnsigned(data, length))};
        case SnmpValueType::IpAddress: {
            if (length != 4) {
                throw core::FormatError("IpAddress must be 4 octets, got " +
                                        std::to_string(length));
            }
            core::IpAddress address;
            std::copy(data, data + 4, address.value.begin());
            return address;
        }
        case SnmpValueType::ObjectIdentifier:
            return core::ObjectIdentifierValue{decodeOid(data, length)};
        case SnmpValueType::Null:
            return core::Null{};
        case SnmpValueType::NoSuchObject:
            return core::NoSuchObject{};
        case SnmpValueType::NoSuchInstance:
            return core::NoSuchInstance{};
        case SnmpValueType::EndOfMibView:
            return core::EndOfMibView{};
    }
    throw core::FormatError("Unsupported value tag " + hexTag(tlv.tag));
}

core::SnmpValue BerCodec::decodeValue(const std::vector<uint8_t>& encoded,
                                      std::optional<core::SnmpValueType> expected) {
    BerReader reader(encoded);
    auto tlv = reader.read();
    if (!reader.atEnd()) {
        throw core::FormatError("Trailing data after value");
    }
    return decodeValue(tlv, expected);
}

} // namespace snmplink::infra
