/**
 * @file ObjectIdentifier.hpp
 * @brief SNMP object identifier (OID) value type.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace snmpwire::core {

/**
 * @brief Ordered sequence of sub-identifiers naming a node in the MIB tree.
 *
 * Immutable once constructed. Equality and ordering are component-wise.
 */
class ObjectIdentifier {
public:
    ObjectIdentifier() = default;
    ObjectIdentifier(std::initializer_list<uint32_t> components) : components_(components) {}
    explicit ObjectIdentifier(std::vector<uint32_t> components)
        : components_(std::move(components)) {}

    /**
     * @brief Parses dotted notation such as "1.3.6.1.2.1.1.1.0".
     *
     * A single leading dot is accepted. Throws std::invalid_argument on empty
     * components, non-digits, or values that do not fit in 32 bits.
     */
    static ObjectIdentifier fromString(const std::string& text);

    /**
     * @brief Renders the identifier in dotted notation.
     * @return Dotted string, or an empty string for an empty identifier.
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const std::vector<uint32_t>& components() const { return components_; }
    [[nodiscard]] size_t size() const { return components_.size(); }
    [[nodiscard]] bool empty() const { return components_.empty(); }
    uint32_t operator[](size_t index) const { return components_[index]; }

    /**
     * @brief Returns a copy extended with one more sub-identifier.
     */
    [[nodiscard]] ObjectIdentifier child(uint32_t component) const;

    bool operator==(const ObjectIdentifier& other) const = default;

private:
    std::vector<uint32_t> components_;
};

} // namespace snmpwire::core
