#include <catch2/catch_test_macros.hpp>

#include "core/identity/IdentityResolver.hpp"

#include <set>
#include <stdexcept>

using namespace netledger::core;

TEST_CASE("Hardware address normalization", "[IdentityResolver]") {
    SECTION("Colon and dash separators, any case") {
        REQUIRE(IdentityResolver::normalizeHardwareAddress("AA:BB:CC:DD:EE:FF") ==
                "aa:bb:cc:dd:ee:ff");
        REQUIRE(IdentityResolver::normalizeHardwareAddress("aa-bb-cc-0d-ee-0f") ==
                "aa:bb:cc:0d:ee:0f");
    }

    SECTION("Malformed addresses") {
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("").has_value());
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("aa:bb:cc:dd:ee").has_value());
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("aa:bb-cc:dd:ee:ff").has_value());
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("gg:bb:cc:dd:ee:ff").has_value());
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("aabbccddeeff").has_value());
        REQUIRE_FALSE(IdentityResolver::normalizeHardwareAddress("a:bb:cc:dd:ee:fff").has_value());
    }

    SECTION("Zero address detection") {
        REQUIRE(IdentityResolver::isZeroHardwareAddress("00:00:00:00:00:00"));
        REQUIRE_FALSE(IdentityResolver::isZeroHardwareAddress("00:00:00:00:00:01"));
    }
}

TEST_CASE("Identity resolution", "[IdentityResolver]") {
    SECTION("Well-formed hardware address is used") {
        REQUIRE(IdentityResolver::resolve("192.168.1.10", "AA-BB-CC-DD-EE-FF") ==
                "aa:bb:cc:dd:ee:ff");
    }

    SECTION("Absent, zero or malformed addresses yield the pseudo-identity") {
        REQUIRE(IdentityResolver::resolve("192.168.1.10", std::nullopt) == "00:00:c0:a8:01:0a");
        REQUIRE(IdentityResolver::resolve("192.168.1.10", "00:00:00:00:00:00") ==
                "00:00:c0:a8:01:0a");
        REQUIRE(IdentityResolver::resolve("192.168.1.10", "not-a-mac") == "00:00:c0:a8:01:0a");
        REQUIRE(IdentityResolver::resolve("192.168.1.10", "") == "00:00:c0:a8:01:0a");
    }

    SECTION("Pseudo-identity is a pure function of the address") {
        auto first = IdentityResolver::resolve("10.0.0.5", std::nullopt);
        auto second = IdentityResolver::resolve("10.0.0.5", std::nullopt);
        REQUIRE(first == second);
        REQUIRE(first == "00:00:0a:00:00:05");
    }

    SECTION("Distinct addresses never collide") {
        std::set<std::string> identities;
        for (int i = 1; i < 255; ++i) {
            identities.insert(IdentityResolver::resolve("10.0.0." + std::to_string(i), std::nullopt));
            identities.insert(IdentityResolver::resolve("10.0.1." + std::to_string(i), std::nullopt));
        }
        REQUIRE(identities.size() == 2 * 254);
    }

    SECTION("Invalid IPv4 is rejected") {
        REQUIRE_THROWS_AS(IdentityResolver::resolve("10.0.0.256", std::nullopt),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(IdentityResolver::resolve("", "aa:bb:cc:dd:ee:ff"),
                          std::invalid_argument);
    }
}

TEST_CASE("Fallback hostname", "[IdentityResolver]") {
    REQUIRE(IdentityResolver::fallbackHostname("10.0.0.5") == "host-10-0-0-5");
    REQUIRE(IdentityResolver::fallbackHostname("192.168.100.254") == "host-192-168-100-254");
}
