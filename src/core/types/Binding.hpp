/**
 * @file Binding.hpp
 * @brief SNMP variable binding and MIB-tree ordering.
 */

#pragma once

#include "core/types/ObjectIdentifier.hpp"
#include "core/types/SnmpValue.hpp"

#include <string>
#include <vector>

namespace snmpwire::core {

/**
 * @brief SNMP variable binding (OID + value pair).
 *
 * Request bindings are created by the caller with a Null placeholder;
 * response bindings are produced by decoding a reply.
 */
struct Binding {
    ObjectIdentifier name; ///< Managed object instance
    Value value{Null{}};   ///< Value assigned to the instance

    /**
     * @brief Formats the binding as "name = TYPE: value" for logs and output.
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Binding& other) const = default;
};

/**
 * @brief Checks whether @p a precedes @p b in the MIB tree.
 *
 * Names are compared component by component up to the shorter length and the
 * first difference decides. When one name is a strict prefix of the other the
 * prefix comes first. Identical names are not less than each other.
 */
bool bindingLess(const Binding& a, const Binding& b);

/**
 * @brief Strict weak ordering functor over bindings, for std::sort and friends.
 */
struct BindingLess {
    bool operator()(const Binding& a, const Binding& b) const { return bindingLess(a, b); }
};

/**
 * @brief Tests whether @p instance lies in the subtree rooted at @p prefix.
 *
 * An identifier is in its own subtree.
 */
bool hasPrefix(const ObjectIdentifier& instance, const ObjectIdentifier& prefix);

/**
 * @brief Builds request bindings (Null values) for the given names.
 */
std::vector<Binding> makeRequestBindings(const std::vector<ObjectIdentifier>& names);

} // namespace snmpwire::core
