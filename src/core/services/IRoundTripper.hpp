/**
 * @file IRoundTripper.hpp
 * @brief Interface for executing a single SNMP transaction.
 */

#pragma once

#include "core/types/SnmpPdu.hpp"

namespace snmpwire::core {

/**
 * @brief Ability to execute one SNMP request/response exchange.
 *
 * Implementations perform exactly one send and one receive per call and
 * never retry. They throw TransportError, EncodeError or DecodeError on
 * failure; the reply is returned unvalidated.
 */
class IRoundTripper {
public:
    virtual ~IRoundTripper() = default;

    /**
     * @brief Sends @p request and returns the decoded reply.
     *
     * The values of @p request's bindings are reset to Null before encoding.
     */
    virtual Response roundTrip(Request& request) = 0;
};

} // namespace snmpwire::core
