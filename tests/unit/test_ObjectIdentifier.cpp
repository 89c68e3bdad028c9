#include <catch2/catch_test_macros.hpp>

#include "core/types/ObjectIdentifier.hpp"

#include <stdexcept>

using namespace snmpwire::core;

TEST_CASE("ObjectIdentifier parsing", "[ObjectIdentifier]") {
    SECTION("Parses dotted notation") {
        auto oid = ObjectIdentifier::fromString("1.3.6.1.2.1.1.1.0");
        REQUIRE(oid == ObjectIdentifier{1, 3, 6, 1, 2, 1, 1, 1, 0});
        REQUIRE(oid.size() == 9);
    }

    SECTION("Accepts a leading dot") {
        REQUIRE(ObjectIdentifier::fromString(".1.3.6") == ObjectIdentifier{1, 3, 6});
    }

    SECTION("Accepts the largest sub-identifier") {
        auto oid = ObjectIdentifier::fromString("1.3.4294967295");
        REQUIRE(oid[2] == 4294967295u);
    }

    SECTION("Rejects malformed text") {
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString(""), std::invalid_argument);
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString("."), std::invalid_argument);
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString("1..3"), std::invalid_argument);
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString("1.3."), std::invalid_argument);
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString("1.3.x"), std::invalid_argument);
        REQUIRE_THROWS_AS(ObjectIdentifier::fromString("1.3.4294967296"), std::invalid_argument);
    }
}

TEST_CASE("ObjectIdentifier formatting", "[ObjectIdentifier]") {
    SECTION("Renders dotted notation") {
        ObjectIdentifier oid{1, 3, 6, 1, 4, 1, 9};
        REQUIRE(oid.toString() == "1.3.6.1.4.1.9");
    }

    SECTION("Empty identifier renders as empty string") {
        ObjectIdentifier oid;
        REQUIRE(oid.empty());
        REQUIRE(oid.toString().empty());
    }

    SECTION("Parse and render agree") {
        const std::string text = "1.3.6.1.2.1.2.2.1.10.3";
        REQUIRE(ObjectIdentifier::fromString(text).toString() == text);
    }
}

TEST_CASE("ObjectIdentifier child", "[ObjectIdentifier]") {
    ObjectIdentifier ifDescr{1, 3, 6, 1, 2, 1, 2, 2, 1, 2};
    auto instance = ifDescr.child(7);

    REQUIRE(instance.size() == ifDescr.size() + 1);
    REQUIRE(instance[instance.size() - 1] == 7);
    REQUIRE(ifDescr.size() == 10);
}
