/**
 * @file SnmpPdu.hpp
 * @brief Request and response messages exchanged in one SNMP round trip.
 */

#pragma once

#include "core/types/Binding.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snmpwire::core {

/**
 * @brief Query operations supported by the engine.
 */
enum class OperationKind : int {
    Get = 0,     ///< GetRequest-PDU, context tag 0
    GetNext = 1, ///< GetNextRequest-PDU, context tag 1
    GetBulk = 5  ///< GetBulkRequest-PDU, context tag 5
};

/**
 * @brief An SNMP query to be sent over a transport.
 *
 * nonRepeaters and maxRepetitions are only meaningful for GetBulk.
 */
struct Request {
    int32_t id{0};                              ///< Request identifier echoed by the agent
    OperationKind kind{OperationKind::Get};     ///< Operation to perform
    std::vector<Binding> bindings;              ///< Names to query (values are placeholders)
    int32_t nonRepeaters{0};                    ///< GetBulk: leading non-repeated bindings
    int32_t maxRepetitions{0};                  ///< GetBulk: repetitions for the remainder

    bool operator==(const Request& other) const = default;
};

/**
 * @brief A decoded reply PDU.
 */
struct Response {
    int32_t id{0};                 ///< Request identifier from the reply
    int errorStatus{0};            ///< RFC 3416 error-status (0 = noError)
    int errorIndex{0};             ///< Position of the binding that caused the error
    std::vector<Binding> bindings; ///< Bindings in wire order

    /**
     * @brief Finds a binding by name.
     * @param name The identifier to search for.
     * @return The binding if found, std::nullopt otherwise.
     */
    [[nodiscard]] std::optional<Binding> find(const ObjectIdentifier& name) const {
        for (const auto& binding : bindings) {
            if (binding.name == name) {
                return binding;
            }
        }
        return std::nullopt;
    }

    bool operator==(const Response& other) const = default;
};

/**
 * @brief Converts an operation kind to its string representation.
 * @return "Get", "GetNext" or "GetBulk".
 */
inline std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Get: return "Get";
        case OperationKind::GetNext: return "GetNext";
        case OperationKind::GetBulk: return "GetBulk";
    }
    return "Unknown";
}

/**
 * @brief Parses an operation name (case sensitive, as printed by
 *        operationKindToString).
 * @return The matching kind, std::nullopt for anything else.
 */
inline std::optional<OperationKind> operationKindFromString(const std::string& str) {
    if (str == "Get") return OperationKind::Get;
    if (str == "GetNext") return OperationKind::GetNext;
    if (str == "GetBulk") return OperationKind::GetBulk;
    return std::nullopt;
}

} // namespace snmpwire::core
