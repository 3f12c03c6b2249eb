#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NmapDiscovery.hpp"
#include "support/Fakes.hpp"

using namespace netledger::core;
using namespace netledger::infra;
using netledger::testing::FakeCommandRunner;

namespace {

const char* kNmapOutput =
    "Starting Nmap 7.94 ( https://nmap.org ) at 2024-05-01 10:00 UTC\n"
    "Nmap scan report for router.lan (192.168.1.1)\n"
    "Host is up (0.0010s latency).\n"
    "MAC Address: 00:11:22:33:44:55 (Netgear)\n"
    "Nmap scan report for 192.168.1.42\n"
    "Host is up (0.0020s latency).\n"
    "MAC Address: AA:BB:CC:DD:EE:FF (Unknown)\n"
    "Nmap scan report for 192.168.1.50\n"
    "Host is up.\n"
    "Nmap done: 256 IP addresses (3 hosts up) scanned in 2.10 seconds\n";

} // namespace

TEST_CASE("nmap -sn output parsing", "[NmapDiscovery]") {
    auto hosts = NmapDiscovery::parseOutput(kNmapOutput);
    REQUIRE(hosts.size() == 3);

    const auto& router = hosts.at(*Ipv4Address::parse("192.168.1.1"));
    REQUIRE(router.hostname == "router.lan");
    REQUIRE(router.hardwareAddress == "00:11:22:33:44:55");
    REQUIRE(router.vendor == "Netgear");
    REQUIRE(router.source == "nmap");

    const auto& bare = hosts.at(*Ipv4Address::parse("192.168.1.42"));
    REQUIRE_FALSE(bare.hostname.has_value());
    REQUIRE(bare.hardwareAddress == "AA:BB:CC:DD:EE:FF");
    REQUIRE_FALSE(bare.vendor.has_value());

    SECTION("The scanning host itself has no MAC line") {
        const auto& self = hosts.at(*Ipv4Address::parse("192.168.1.50"));
        REQUIRE_FALSE(self.hardwareAddress.has_value());
    }
}

TEST_CASE("nmap discovery outcomes", "[NmapDiscovery]") {
    FakeCommandRunner runner;
    NmapDiscovery discovery(runner, std::chrono::seconds(60));
    auto subnet = *Subnet::parse("192.168.1.0/24");

    SECTION("Tool missing") {
        REQUIRE(discovery.discover(subnet, {}).status == DiscoveryStatus::Unavailable);
    }

    SECTION("Success") {
        runner.setOutput("nmap", kNmapOutput);
        auto outcome = discovery.discover(subnet, {});
        REQUIRE(outcome.ok());
        REQUIRE(outcome.hosts.size() == 3);
        REQUIRE(runner.calls()[0] == std::vector<std::string>{"nmap", "-sn", "192.168.1.0/24"});
    }

    SECTION("Failure keeps partial results") {
        runner.setOutput("nmap", kNmapOutput, 1);
        auto outcome = discovery.discover(subnet, {});
        REQUIRE(outcome.status == DiscoveryStatus::Failed);
        REQUIRE(outcome.hosts.size() == 3);
    }
}
