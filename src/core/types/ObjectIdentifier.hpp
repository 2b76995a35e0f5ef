/**
 * @file ObjectIdentifier.hpp
 * @brief Canonical numeric object identifier with an optional MIB annotation.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmplink::core {

/**
 * @brief Module and symbol an OID was resolved from.
 */
struct MibAnnotation {
    std::string module; ///< MIB module that defines the symbol
    std::string symbol; ///< Symbol name inside the module

    bool operator==(const MibAnnotation& other) const = default;
};

/**
 * @brief Numeric object identifier.
 *
 * Comparison and wire encoding only look at the numeric components; the
 * annotation is informational.
 */
struct ObjectIdentifier {
    std::vector<uint32_t> components;     ///< Sub-identifiers in order
    std::optional<MibAnnotation> annotation; ///< Symbolic origin, if any

    ObjectIdentifier() = default;
    explicit ObjectIdentifier(std::vector<uint32_t> numeric,
                              std::optional<MibAnnotation> origin = std::nullopt)
        : components(std::move(numeric)), annotation(std::move(origin)) {}

    /**
     * @brief Parses a dotted numeric OID ("1.3.6.1" or ".1.3.6.1").
     * @param text The dotted string.
     * @return The parsed identifier.
     * @throws FormatError if a component is not an unsigned 32-bit number.
     */
    static ObjectIdentifier fromString(const std::string& text);

    /**
     * @brief Formats the OID in leading-dot notation (".1.3.6.1.2.1.1.1.0").
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool empty() const { return components.empty(); }
    [[nodiscard]] size_t size() const { return components.size(); }

    /**
     * @brief Checks whether this OID is a prefix of (or equal to) another.
     */
    [[nodiscard]] bool isPrefixOf(const ObjectIdentifier& other) const;

    bool operator==(const ObjectIdentifier& other) const {
        return components == other.components;
    }

    std::strong_ordering operator<=>(const ObjectIdentifier& other) const {
        return components <=> other.components;
    }
};

} // namespace snmplink::core
