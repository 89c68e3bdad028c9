#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/codec/PduCodec.hpp"
#include "core/codec/ValueNormalizer.hpp"
#include "core/types/Binding.hpp"

#include <algorithm>
#include <vector>

using namespace snmpwire::core;
using namespace snmpwire::core::codec;

// =============================================================================
// PDU Benchmarks
// =============================================================================

TEST_CASE("PDU codec benchmarks", "[benchmark][PduCodec]") {
    Request request;
    request.id = 123456;
    request.kind = OperationKind::GetBulk;
    request.maxRepetitions = 25;
    request.bindings = makeRequestBindings({ObjectIdentifier{1, 3, 6, 1, 2, 1, 2, 2, 1, 10},
                                            ObjectIdentifier{1, 3, 6, 1, 2, 1, 2, 2, 1, 16}});

    BENCHMARK("Encode GetBulk request") {
        return encodeRequest(request, "public");
    };

    Response response;
    response.id = request.id;
    for (uint32_t i = 1; i <= 50; ++i) {
        response.bindings.push_back(
            Binding{ObjectIdentifier{1, 3, 6, 1, 2, 1, 31, 1, 1, 1, 6, i}, Counter64{i * 1000003ull}});
        response.bindings.push_back(
            Binding{ObjectIdentifier{1, 3, 6, 1, 2, 1, 2, 2, 1, 2, i},
                    OctetString{{'e', 't', 'h', static_cast<uint8_t>('0' + i % 10)}}});
    }
    auto encoded = encodeResponse(response, "public");

    BENCHMARK("Decode 100-binding response") {
        return decodeResponse(encoded);
    };
}

// =============================================================================
// Value Benchmarks
// =============================================================================

TEST_CASE("Value benchmarks", "[benchmark][ValueNormalizer]") {
    auto counter = encodeValue(Counter32{4000000000u});
    BerReader reader(counter);
    auto raw = reader.readRaw();

    BENCHMARK("Decode Counter32") {
        return decodeValue(raw);
    };

    Binding binding{ObjectIdentifier{1, 3, 6, 1, 2, 1, 2, 2, 1, 10, 1}, Counter32{4000000000u}};

    BENCHMARK("Typed extraction") {
        return decodeBindingValue<uint64_t>(binding);
    };

    std::vector<uint8_t> text{10, 'G', 'i', 'g', 'a', 'b', 'i', 't', 'E', 't', 'h'};

    BENCHMARK("Printable string heuristic") {
        return toPrintableString(text);
    };
}

TEST_CASE("Binding ordering benchmarks", "[benchmark][Binding]") {
    std::vector<Binding> bindings;
    for (uint32_t table = 1; table <= 20; ++table) {
        for (uint32_t row = 100; row > 0; --row) {
            bindings.push_back(Binding{ObjectIdentifier{1, 3, 6, 1, 2, 1, 2, 2, 1, table, row}});
        }
    }

    BENCHMARK("Sort 2000 bindings") {
        auto copy = bindings;
        std::sort(copy.begin(), copy.end(), BindingLess{});
        return copy.size();
    };
}
