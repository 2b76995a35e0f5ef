#include "infrastructure/mib/OidResolver.hpp"

#include "core/types/SnmpErrors.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

namespace snmplink::infra {

namespace {

std::vector<std::string_view> splitDots(std::string_view text) {
    std::vector<std::string_view> parts;
    while (true) {
        auto dot = text.find('.');
        parts.push_back(text.substr(0, dot));
        if (dot == std::string_view::npos) {
            break;
        }
        text.remove_prefix(dot + 1);
    }
    return parts;
}

} // namespace

OidResolver::OidResolver(std::shared_ptr<core::IMibLookup> mib) : mib_(std::move(mib)) {}

OidSegment OidResolver::parseSegment(std::string_view segment) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (!segment.empty() && ec == std::errc() && ptr == segment.data() + segment.size()) {
        return value;
    }
    return std::string(segment);
}

OidExpression OidResolver::parse(const std::string& expression) {
    if (expression.empty()) {
        throw core::UnknownSymbolError("Empty OID expression");
    }

    OidExpression result;
    std::string_view rest(expression);

    auto separator = rest.find("::");
    if (separator != std::string_view::npos) {
        result.symbolic = true;
        result.module = std::string(rest.substr(0, separator));
        rest.remove_prefix(separator + 2);
    } else if (rest.front() == '.') {
        rest.remove_prefix(1);
    } else {
        result.symbolic = true;
    }

    auto parts = splitDots(rest);
    for (auto part : parts) {
        if (part.empty()) {
            throw core::UnknownSymbolError("Empty segment in OID \"" + expression + "\"");
        }
    }

    auto first = parts.begin();
    if (result.symbolic) {
        result.symbol = std::string(*first);
        ++first;
    }
    for (auto it = first; it != parts.end(); ++it) {
        result.segments.push_back(parseSegment(*it));
    }

    return result;
}

core::ObjectIdentifier OidResolver::resolve(const std::string& expression) const {
    auto parsed = parse(expression);
    auto oid = resolve(parsed);
    spdlog::debug("Resolved {} to {}", expression, oid.toString());
    return oid;
}

core::ObjectIdentifier OidResolver::resolve(const OidExpression& expression) const {
    core::ObjectIdentifier oid;
    std::string text = expression.symbolic
                           ? (expression.module.empty() ? "" : expression.module + "::") +
                                 expression.symbol
                           : std::string(".");

    if (expression.symbolic) {
        auto symbol = mib_->resolve(expression.module, expression.symbol);
        if (!symbol) {
            if (expression.module.empty()) {
                throw core::UnknownSymbolError("Symbol \"" + expression.symbol +
                                               "\" not found in any loaded MIB");
            }
            throw core::UnknownSymbolError("Symbol \"" + expression.symbol +
                                           "\" not found in MIB module \"" +
                                           expression.module + "\"");
        }
        oid = symbol->oid;
        oid.annotation = core::MibAnnotation{symbol->module, symbol->name};
    }

    for (const auto& segment : expression.segments) {
        appendSegment(oid, segment, text);
    }

    if (oid.empty()) {
        throw core::UnknownSymbolError("OID expression \"" + text + "\" has no components");
    }
    return oid;
}

void OidResolver::appendSegment(core::ObjectIdentifier& oid,
                                const OidSegment& segment,
                                const std::string& expression) const {
    if (const auto* number = std::get_if<uint32_t>(&segment)) {
        oid.components.push_back(*number);
        return;
    }

    const auto& label = std::get<std::string>(segment);
    auto child = mib_->resolveChild(oid, label);
    if (!child) {
        throw core::UnknownSymbolError("Label \"" + label + "\" is not a child of \"" +
                                       (oid.empty() ? expression : oid.toString()) + "\"");
    }
    oid.components = child->oid.components;
}

} // namespace snmplink::infra
