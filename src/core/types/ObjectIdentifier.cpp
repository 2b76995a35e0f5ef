#include "core/types/ObjectIdentifier.hpp"

#include "core/types/SnmpErrors.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace snmplink::core {

ObjectIdentifier ObjectIdentifier::fromString(const std::string& text) {
    std::string_view rest(text);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
    }
    if (rest.empty()) {
        throw FormatError("Empty OID");
    }

    std::vector<uint32_t> components;
    while (true) {
        auto dot = rest.find('.');
        auto token = rest.substr(0, dot);

        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
            throw FormatError("Invalid OID component \"" + std::string(token) + "\" in " + text);
        }
        components.push_back(value);

        if (dot == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(dot + 1);
    }

    return ObjectIdentifier(std::move(components));
}

std::string ObjectIdentifier::toString() const {
    std::ostringstream oss;
    for (auto component : components) {
        oss << "." << component;
    }
    return oss.str();
}

bool ObjectIdentifier::isPrefixOf(const ObjectIdentifier& other) const {
    if (components.size() > other.components.size()) return false;
    return std::equal(components.begin(), components.end(), other.components.begin());
}

} // namespace snmplink::core
