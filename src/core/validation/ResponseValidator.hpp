#pragma once

#include "core/types/SnmpPdu.hpp"

namespace snmpwire::core {

/**
 * @brief Checks a decoded response against the request that produced it.
 *
 * Rules are applied in order and the first violation is thrown:
 * 1. the response id must equal the request id;
 * 2. the error-status must be zero (the error names the request binding at
 *    error-index when that index is in range);
 * 3. the response must carry at least as many bindings as the request, and
 *    no more unless the request is a GetBulk;
 * 4. no binding may hold NoSuchObject, NoSuchInstance, EndOfMibView or Null,
 *    and every name must start with 1.3.
 *
 * Binding names are not matched positionally against the request.
 *
 * @throws ValidationError describing the first violated rule.
 */
void checkResponse(const Response& response, const Request& request);

} // namespace snmpwire::core
