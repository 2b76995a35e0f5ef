#pragma once

#include "core/services/IMibLookup.hpp"
#include "core/types/ObjectIdentifier.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace snmplink::infra {

/**
 * @brief One dot-separated OID segment: a sub-identifier or a symbol label.
 */
using OidSegment = std::variant<uint32_t, std::string>;

/**
 * @brief Parsed, unresolved OID expression.
 *
 * Symbolic expressions ("SNMPv2-MIB::sysDescr.0", "sysDescr.0") carry a
 * module (possibly empty) and a symbol followed by suffix segments. Leading
 * dot expressions (".1.3.6.1", ".iso.org.6.internet") only carry segments.
 */
struct OidExpression {
    bool symbolic{false};
    std::string module;
    std::string symbol;
    std::vector<OidSegment> segments;

    bool operator==(const OidExpression& other) const = default;
};

/**
 * @brief Turns OID expressions in any supported notation into numeric OIDs.
 *
 * Supported notations:
 * - `MODULE::symbol.suffix...`
 * - `.1.3.6.1.2.1.1.1.0` and mixed `.iso.org.6.internet.2.1.1.1.0`
 * - `symbol.suffix...`, searching every loaded MIB module
 */
class OidResolver {
public:
    explicit OidResolver(std::shared_ptr<core::IMibLookup> mib);

    /**
     * @brief Splits an expression into module, symbol and segments.
     * @throws core::UnknownSymbolError for an empty expression, symbol or segment.
     */
    static OidExpression parse(const std::string& expression);

    /**
     * @brief Parses one segment: an unsigned 32-bit number if it is one,
     * otherwise the label text unchanged.
     */
    static OidSegment parseSegment(std::string_view segment);

    /**
     * @brief Resolves an expression to a numeric OID.
     * @return The OID, annotated with module and symbol for symbolic input.
     * @throws core::UnknownSymbolError if a module, symbol or label is unknown.
     */
    core::ObjectIdentifier resolve(const std::string& expression) const;

    core::ObjectIdentifier resolve(const OidExpression& expression) const;

private:
    void appendSegment(core::ObjectIdentifier& oid,
                       const OidSegment& segment,
                       const std::string& expression) const;

    std::shared_ptr<core::IMibLookup> mib_;
};

} // namespace snmplink::infra
