#include "infrastructure/network/RequestIdGenerator.hpp"

#include <chrono>
#include <limits>

namespace snmpwire::infra {

namespace {

std::seed_seq::result_type clockBits(int shift) {
    auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return static_cast<std::seed_seq::result_type>(static_cast<uint64_t>(ticks) >> shift);
}

} // anonymous namespace

RequestIdGenerator::RequestIdGenerator()
    : distribution_(0, std::numeric_limits<int32_t>::max()) {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd(), clockBits(0), clockBits(32)};
    engine_.seed(seed);
}

RequestIdGenerator::RequestIdGenerator(uint64_t seed)
    : engine_(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32))),
      distribution_(0, std::numeric_limits<int32_t>::max()) {}

int32_t RequestIdGenerator::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution_(engine_);
}

RequestIdGenerator& RequestIdGenerator::instance() {
    static RequestIdGenerator instance;
    return instance;
}

} // namespace snmpwire::infra
