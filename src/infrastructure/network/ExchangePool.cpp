#include "infrastructure/network/ExchangePool.hpp"

#include <spdlog/spdlog.h>

namespace snmpwire::infra {

ExchangePool::ExchangePool(size_t workers) : workerCount_(workers > 0 ? workers : 1) {}

ExchangePool::~ExchangePool() {
    shutdown();
}

void ExchangePool::start() {
    if (running_.exchange(true)) {
        return;
    }

    ioContext_.restart();
    workGuard_.emplace(asio::make_work_guard(ioContext_));

    workers_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this, i]() {
            const auto handled = ioContext_.run();
            spdlog::debug("SNMP worker {} exiting after {} exchanges", i, handled);
        });
    }

    spdlog::debug("SNMP exchange pool running {} workers", workerCount_);
}

void ExchangePool::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    if (pending_ > 0) {
        spdlog::debug("SNMP exchange pool draining {} exchanges", pending_.load());
    }

    // Without the guard run() returns once the queue is empty.
    workGuard_.reset();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

} // namespace snmpwire::infra
