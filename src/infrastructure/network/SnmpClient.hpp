#pragma once

#include "core/services/IRoundTripper.hpp"
#include "infrastructure/network/ExchangePool.hpp"
#include "infrastructure/network/RequestIdGenerator.hpp"

#include <functional>
#include <future>
#include <memory>
#include <vector>

namespace snmpwire::infra {

/**
 * @brief Tunables for multi-request operations.
 */
struct ClientOptions {
    int32_t nonRepeaters{0};     ///< Default GetBulk non-repeaters
    int32_t maxRepetitions{10};  ///< Default GetBulk max-repetitions
    int walkMaxIterations{1000}; ///< Round trips allowed per walk

    bool operator==(const ClientOptions& other) const = default;
};

/**
 * @brief Validated SNMP queries and MIB walks over a round tripper.
 *
 * Every method draws a fresh request id, performs the exchange, and runs
 * core::checkResponse on the reply before returning its bindings. Errors are
 * logged and rethrown.
 *
 * The client is as thread safe as its transport, i.e. not at all for
 * SnmpTransport. Use AsyncSnmpClient for parallel queries.
 */
class SnmpClient {
public:
    /**
     * @brief Constructs a client.
     * @param transport Round tripper used for every exchange.
     * @param options Bulk and walk tunables.
     * @param ids Request id source; defaults to the process-wide generator.
     */
    explicit SnmpClient(std::shared_ptr<core::IRoundTripper> transport,
                        ClientOptions options = {},
                        RequestIdGenerator& ids = RequestIdGenerator::instance());

    /**
     * @brief Performs a GET.
     * @return Bindings in wire order.
     */
    std::vector<core::Binding> get(const std::vector<core::ObjectIdentifier>& names);

    /**
     * @brief Performs a GET-NEXT.
     *
     * Each returned name must follow the requested name at the same position.
     *
     * @return Bindings in wire order.
     */
    std::vector<core::Binding> getNext(const std::vector<core::ObjectIdentifier>& names);

    /**
     * @brief Performs a GET-BULK with the given repetition parameters.
     * @return Bindings in wire order.
     */
    std::vector<core::Binding> getBulk(const std::vector<core::ObjectIdentifier>& names,
                                       int32_t nonRepeaters,
                                       int32_t maxRepetitions);

    /**
     * @brief Walks the subtree under @p root with GET-NEXT.
     *
     * Stops when a name leaves the subtree or the agent reports the end of
     * its MIB view.
     *
     * @return All bindings under @p root in MIB tree order.
     */
    std::vector<core::Binding> walk(const core::ObjectIdentifier& root);

    /**
     * @brief Walks the subtree under @p root with GET-BULK.
     * @param maxRepetitions Bindings requested per round trip.
     * @return All bindings under @p root, sorted and without duplicates.
     */
    std::vector<core::Binding> bulkWalk(const core::ObjectIdentifier& root,
                                        int32_t maxRepetitions);

    /**
     * @brief Sends @p request (after assigning a fresh id) and validates the reply.
     */
    core::Response execute(core::Request& request);

    [[nodiscard]] const ClientOptions& options() const { return options_; }

private:
    core::Request makeRequest(core::OperationKind kind,
                              const std::vector<core::ObjectIdentifier>& names);

    // Assigns a fresh id and performs the round trip; failures are logged.
    core::Response exchange(core::Request& request);

    std::shared_ptr<core::IRoundTripper> transport_;
    ClientOptions options_;
    RequestIdGenerator& ids_;
};

/**
 * @brief Runs SnmpClient operations on an ExchangePool.
 *
 * Every call obtains its own transport from the factory, so calls may run
 * in parallel.
 */
class AsyncSnmpClient {
public:
    using TransportFactory = std::function<std::shared_ptr<core::IRoundTripper>()>;

    AsyncSnmpClient(ExchangePool& pool, TransportFactory factory, ClientOptions options = {});

    std::future<std::vector<core::Binding>> getAsync(std::vector<core::ObjectIdentifier> names);

    std::future<std::vector<core::Binding>> walkAsync(core::ObjectIdentifier root);

    std::future<std::vector<core::Binding>> bulkWalkAsync(core::ObjectIdentifier root);

private:
    ExchangePool& pool_;
    TransportFactory factory_;
    ClientOptions options_;
};

} // namespace snmpwire::infra
