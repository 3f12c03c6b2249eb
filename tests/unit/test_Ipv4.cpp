#include <catch2/catch_test_macros.hpp>

#include "core/types/Ipv4.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace netledger::core;

TEST_CASE("Ipv4Address parsing", "[Ipv4]") {
    SECTION("Valid addresses") {
        auto address = Ipv4Address::parse("192.168.1.10");
        REQUIRE(address.has_value());
        REQUIRE(address->toString() == "192.168.1.10");
        REQUIRE(address->octets() == std::array<uint8_t, 4>{192, 168, 1, 10});

        REQUIRE(Ipv4Address::parse("0.0.0.0").has_value());
        REQUIRE(Ipv4Address::parse("255.255.255.255").has_value());
    }

    SECTION("Invalid addresses") {
        REQUIRE_FALSE(Ipv4Address::parse("").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("192.168.1").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("192.168.1.256").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("192.168.1.1.1").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("192.168..1").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("a.b.c.d").has_value());
        REQUIRE_FALSE(Ipv4Address::parse(" 192.168.1.1").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("192.168.1.1 ").has_value());
        REQUIRE_FALSE(Ipv4Address::parse("STANDALONE").has_value());
    }

    SECTION("Ordering is numeric") {
        auto low = *Ipv4Address::parse("10.0.0.9");
        auto high = *Ipv4Address::parse("10.0.0.10");
        REQUIRE(low < high);
        REQUIRE(Ipv4Address::fromOctets(10, 0, 0, 9) == low);
    }
}

TEST_CASE("Subnet parsing and arithmetic", "[Ipv4]") {
    SECTION("Host bits are cleared") {
        auto subnet = Subnet::parse("192.168.1.77/24");
        REQUIRE(subnet.has_value());
        REQUIRE(subnet->toString() == "192.168.1.0/24");
        REQUIRE(subnet->netmask().toString() == "255.255.255.0");
        REQUIRE(subnet->broadcast().toString() == "192.168.1.255");
    }

    SECTION("Bare address is a /32") {
        auto subnet = Subnet::parse("10.1.2.3");
        REQUIRE(subnet.has_value());
        REQUIRE(subnet->prefixLength == 32);
        REQUIRE(subnet->hostCount() == 1);
    }

    SECTION("Malformed CIDR") {
        REQUIRE_FALSE(Subnet::parse("10.0.0.0/33").has_value());
        REQUIRE_FALSE(Subnet::parse("10.0.0.0/").has_value());
        REQUIRE_FALSE(Subnet::parse("10.0.0/24").has_value());
    }

    SECTION("Host enumeration skips network and broadcast") {
        auto subnet = *Subnet::parse("10.0.0.0/29");
        auto hosts = subnet.hosts();
        REQUIRE(subnet.hostCount() == 6);
        REQUIRE(hosts.size() == 6);
        REQUIRE(hosts.front().toString() == "10.0.0.1");
        REQUIRE(hosts.back().toString() == "10.0.0.6");
        REQUIRE(std::is_sorted(hosts.begin(), hosts.end()));
    }

    SECTION("/31 counts both addresses") {
        auto subnet = *Subnet::parse("10.0.0.0/31");
        REQUIRE(subnet.hosts().size() == 2);
    }

    SECTION("Containment") {
        auto subnet = *Subnet::parse("172.16.0.0/16");
        REQUIRE(subnet.contains(*Ipv4Address::parse("172.16.200.1")));
        REQUIRE_FALSE(subnet.contains(*Ipv4Address::parse("172.17.0.1")));
    }

    SECTION("Prefix from netmask") {
        REQUIRE(Subnet::prefixFromNetmask(*Ipv4Address::parse("255.255.255.0")) == 24);
        REQUIRE(Subnet::prefixFromNetmask(*Ipv4Address::parse("255.255.252.0")) == 22);
        REQUIRE(Subnet::prefixFromNetmask(*Ipv4Address::parse("0.0.0.0")) == 0);
        REQUIRE_FALSE(Subnet::prefixFromNetmask(*Ipv4Address::parse("255.0.255.0")).has_value());
    }
}

TEST_CASE("Ipv4Range parsing", "[Ipv4]") {
    SECTION("Full form") {
        auto range = Ipv4Range::parse("192.168.1.100-192.168.1.150");
        REQUIRE(range.has_value());
        REQUIRE(range->contains(*Ipv4Address::parse("192.168.1.120")));
        REQUIRE_FALSE(range->contains(*Ipv4Address::parse("192.168.1.151")));
    }

    SECTION("Short form replaces the last octet") {
        auto range = Ipv4Range::parse("192.168.1.100-150");
        REQUIRE(range.has_value());
        REQUIRE(range->last.toString() == "192.168.1.150");
    }

    SECTION("CIDR form") {
        auto range = Ipv4Range::parse("10.0.0.0/30");
        REQUIRE(range.has_value());
        REQUIRE(range->first.toString() == "10.0.0.0");
        REQUIRE(range->last.toString() == "10.0.0.3");
    }

    SECTION("Inverted and malformed ranges are rejected") {
        REQUIRE_FALSE(Ipv4Range::parse("10.0.0.9-10.0.0.1").has_value());
        REQUIRE_FALSE(Ipv4Range::parse("10.0.0.1-300").has_value());
        REQUIRE_FALSE(Ipv4Range::parse("garbage").has_value());
    }
}

TEST_CASE("ipSortKey orders numerically per octet", "[Ipv4]") {
    std::vector<std::string> ips = {"192.168.1.10", "192.168.1.9", "not-an-ip", "10.0.0.1",
                                    "192.168.1.100"};
    std::sort(ips.begin(), ips.end(), [](const std::string& a, const std::string& b) {
        return ipSortKey(a) < ipSortKey(b);
    });

    REQUIRE(ips == std::vector<std::string>{"not-an-ip", "10.0.0.1", "192.168.1.9", "192.168.1.10",
                                            "192.168.1.100"});
    REQUIRE(ipSortKey("0.0.0.0") > ipSortKey("bogus"));
}
