#include "infrastructure/network/SnmpClient.hpp"

#include "core/types/ErrorStatus.hpp"
#include "core/types/SnmpErrors.hpp"
#include "core/validation/ResponseValidator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace snmpwire::infra {

namespace {

// True for the replies that mark the end of a GetNext walk.
bool isEndOfWalk(const core::ValidationError& e) {
    if (e.failure() == core::ValidationFailure::EndOfMibView) {
        return true;
    }
    // SNMPv1-style agents answer noSuchName past the last object.
    return e.failure() == core::ValidationFailure::ServerError &&
           e.errorStatus() == core::ErrorStatus::NoSuchName;
}

core::ValidationError nonIncreasing(const core::ObjectIdentifier& requested,
                                    const core::ObjectIdentifier& returned) {
    core::ValidationError error(core::ValidationFailure::NonIncreasing,
                                returned.toString() + ": does not follow " +
                                    requested.toString());
    error.withBinding(returned);
    return error;
}

} // anonymous namespace

SnmpClient::SnmpClient(std::shared_ptr<core::IRoundTripper> transport,
                       ClientOptions options,
                       RequestIdGenerator& ids)
    : transport_(std::move(transport)), options_(options), ids_(ids) {
    if (!transport_) {
        throw std::invalid_argument("SnmpClient requires a transport");
    }
}

core::Request SnmpClient::makeRequest(core::OperationKind kind,
                                      const std::vector<core::ObjectIdentifier>& names) {
    core::Request request;
    request.kind = kind;
    request.bindings = core::makeRequestBindings(names);
    return request;
}

core::Response SnmpClient::exchange(core::Request& request) {
    request.id = ids_.next();

    try {
        return transport_->roundTrip(request);
    } catch (const core::SnmpError& e) {
        spdlog::warn("SNMP {} request {} failed: {}", core::operationKindToString(request.kind),
                     request.id, e.what());
        throw;
    }
}

core::Response SnmpClient::execute(core::Request& request) {
    auto response = exchange(request);

    try {
        core::checkResponse(response, request);
    } catch (const core::ValidationError& e) {
        spdlog::warn("SNMP {} request {}: {}", core::operationKindToString(request.kind),
                     request.id, e.what());
        throw;
    }
    return response;
}

std::vector<core::Binding> SnmpClient::get(const std::vector<core::ObjectIdentifier>& names) {
    auto request = makeRequest(core::OperationKind::Get, names);
    return execute(request).bindings;
}

std::vector<core::Binding> SnmpClient::getNext(const std::vector<core::ObjectIdentifier>& names) {
    auto request = makeRequest(core::OperationKind::GetNext, names);
    auto response = execute(request);

    for (size_t i = 0; i < request.bindings.size(); ++i) {
        if (!core::bindingLess(request.bindings[i], response.bindings[i])) {
            throw nonIncreasing(request.bindings[i].name, response.bindings[i].name);
        }
    }
    return response.bindings;
}

std::vector<core::Binding> SnmpClient::getBulk(const std::vector<core::ObjectIdentifier>& names,
                                               int32_t nonRepeaters,
                                               int32_t maxRepetitions) {
    auto request = makeRequest(core::OperationKind::GetBulk, names);
    request.nonRepeaters = nonRepeaters;
    request.maxRepetitions = maxRepetitions;
    return execute(request).bindings;
}

std::vector<core::Binding> SnmpClient::walk(const core::ObjectIdentifier& root) {
    std::vector<core::Binding> results;
    core::Binding current{root, core::Null{}};

    for (int iteration = 0; iteration < options_.walkMaxIterations; ++iteration) {
        auto request = makeRequest(core::OperationKind::GetNext, {current.name});

        core::Response response;
        try {
            response = execute(request);
        } catch (const core::ValidationError& e) {
            if (isEndOfWalk(e)) {
                return results;
            }
            throw;
        }

        const auto& next = response.bindings.front();
        if (!core::hasPrefix(next.name, root)) {
            return results;
        }
        if (!core::bindingLess(current, next)) {
            throw nonIncreasing(current.name, next.name);
        }

        results.push_back(next);
        current = next;
    }

    spdlog::warn("Walk of {} stopped after {} requests", root.toString(),
                 options_.walkMaxIterations);
    return results;
}

std::vector<core::Binding> SnmpClient::bulkWalk(const core::ObjectIdentifier& root,
                                                int32_t maxRepetitions) {
    std::vector<core::Binding> results;
    core::Binding current{root, core::Null{}};
    bool finished = false;

    for (int iteration = 0; iteration < options_.walkMaxIterations && !finished; ++iteration) {
        auto request = makeRequest(core::OperationKind::GetBulk, {current.name});
        request.nonRepeaters = 0;
        request.maxRepetitions = maxRepetitions;

        auto response = exchange(request);

        // A bulk reply ends with endOfMibView once the agent runs out of
        // objects; keep what precedes it.
        auto end = std::find_if(response.bindings.begin(), response.bindings.end(),
                                [](const core::Binding& b) {
                                    return std::holds_alternative<core::EndOfMibView>(b.value);
                                });
        if (end != response.bindings.end()) {
            response.bindings.erase(end, response.bindings.end());
            finished = true;
            if (response.bindings.empty() && response.errorStatus == 0 &&
                response.id == request.id) {
                break;
            }
        }

        try {
            core::checkResponse(response, request);
        } catch (const core::ValidationError& e) {
            if (isEndOfWalk(e)) {
                break;
            }
            spdlog::warn("SNMP GetBulk request {}: {}", request.id, e.what());
            throw;
        }

        // Each reply must move the cursor past its start.
        core::Binding furthest = current;
        for (const auto& binding : response.bindings) {
            if (!core::hasPrefix(binding.name, root)) {
                finished = true;
                continue;
            }
            results.push_back(binding);
            if (core::bindingLess(furthest, binding)) {
                furthest = binding;
            }
        }
        if (!finished && !core::bindingLess(current, furthest)) {
            throw nonIncreasing(current.name, response.bindings.back().name);
        }
        current = furthest;
    }

    if (!finished) {
        spdlog::warn("Bulk walk of {} stopped after {} requests", root.toString(),
                     options_.walkMaxIterations);
    }

    std::sort(results.begin(), results.end(), core::BindingLess{});
    results.erase(std::unique(results.begin(), results.end(),
                              [](const core::Binding& a, const core::Binding& b) {
                                  return a.name == b.name;
                              }),
                  results.end());
    return results;
}

AsyncSnmpClient::AsyncSnmpClient(ExchangePool& pool,
                                 TransportFactory factory,
                                 ClientOptions options)
    : pool_(pool), factory_(std::move(factory)), options_(options) {
    if (!factory_) {
        throw std::invalid_argument("AsyncSnmpClient requires a transport factory");
    }
}

std::future<std::vector<core::Binding>> AsyncSnmpClient::getAsync(
    std::vector<core::ObjectIdentifier> names) {
    return pool_.submit([factory = factory_, options = options_, names = std::move(names)]() {
        SnmpClient client(factory(), options);
        return client.get(names);
    });
}

std::future<std::vector<core::Binding>> AsyncSnmpClient::walkAsync(core::ObjectIdentifier root) {
    return pool_.submit([factory = factory_, options = options_, root = std::move(root)]() {
        SnmpClient client(factory(), options);
        return client.walk(root);
    });
}

std::future<std::vector<core::Binding>> AsyncSnmpClient::bulkWalkAsync(
    core::ObjectIdentifier root) {
    return pool_.submit([factory = factory_, options = options_, root = std::move(root)]() {
        SnmpClient client(factory(), options);
        return client.bulkWalk(root, options.maxRepetitions);
    });
}

} // namespace snmpwire::infra
