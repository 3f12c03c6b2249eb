#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ArpScanDiscovery.hpp"
#include "support/Fakes.hpp"

using namespace netledger::core;
using namespace netledger::infra;
using netledger::testing::FakeCommandRunner;

namespace {

const char* kArpScanOutput =
    "Interface: eth0, type: EN10MB, MAC: 02:42:ac:11:00:02, IPv4: 192.168.1.50\n"
    "Starting arp-scan 1.10.0 with 256 hosts (https://github.com/royhills/arp-scan)\n"
    "192.168.1.1\t00:11:22:33:44:55\tNETGEAR\n"
    "192.168.1.20\tAA:BB:CC:DD:EE:FF\t(Unknown)\n"
    "192.168.1.30\t10:20:30:40:50:60\tRaspberry Pi Trading Ltd\n"
    "192.168.1.30\t10:20:30:40:50:61\tRaspberry Pi Trading Ltd (DUP: 2)\n"
    "\n"
    "4 packets received by filter, 0 packets dropped by kernel\n"
    "Ending arp-scan 1.10.0: 256 hosts scanned in 1.934 seconds (132.37 hosts/sec). 3 responded\n";

Subnet subnet() {
    return *Subnet::parse("192.168.1.0/24");
}

} // namespace

TEST_CASE("arp-scan output parsing", "[ArpScanDiscovery]") {
    auto hosts = ArpScanDiscovery::parseOutput(kArpScanOutput);

    REQUIRE(hosts.size() == 3);

    const auto& router = hosts.at(*Ipv4Address::parse("192.168.1.1"));
    REQUIRE(router.hardwareAddress == "00:11:22:33:44:55");
    REQUIRE(router.vendor == "NETGEAR");
    REQUIRE(router.source == "arp-scan");

    SECTION("Unknown vendor is dropped") {
        REQUIRE_FALSE(hosts.at(*Ipv4Address::parse("192.168.1.20")).vendor.has_value());
    }

    SECTION("First reply wins over duplicates") {
        const auto& pi = hosts.at(*Ipv4Address::parse("192.168.1.30"));
        REQUIRE(pi.hardwareAddress == "10:20:30:40:50:60");
        REQUIRE(pi.vendor == "Raspberry Pi Trading Ltd");
    }

    SECTION("Nothing parseable") {
        REQUIRE(ArpScanDiscovery::parseOutput("").empty());
        REQUIRE(ArpScanDiscovery::parseOutput("garbage\tline\n").empty());
    }
}

TEST_CASE("arp-scan discovery outcomes", "[ArpScanDiscovery]") {
    FakeCommandRunner runner;
    ArpScanDiscovery discovery(runner, {"eth0", std::chrono::seconds(30)});

    SECTION("Tool missing is unavailable") {
        auto outcome = discovery.discover(subnet(), {});
        REQUIRE(outcome.status == DiscoveryStatus::Unavailable);
        REQUIRE(runner.calls().empty());
    }

    SECTION("Successful sweep") {
        runner.setOutput("arp-scan", kArpScanOutput);
        auto outcome = discovery.discover(subnet(), {});

        REQUIRE(outcome.ok());
        REQUIRE(outcome.hosts.size() == 3);
        REQUIRE(runner.lastTimeout() == std::chrono::seconds(30));
        auto calls = runner.calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0] == std::vector<std::string>{"arp-scan", "--retry=2", "--interface=eth0",
                                                     "192.168.1.0/24"});
    }

    SECTION("Timeout keeps partial results") {
        runner.setResult("arp-scan", {CommandStatus::TimedOut, 124,
                                      "192.168.1.1\t00:11:22:33:44:55\tNETGEAR\n"});
        auto outcome = discovery.discover(subnet(), {});
        REQUIRE(outcome.status == DiscoveryStatus::Failed);
        REQUIRE(outcome.hosts.size() == 1);
    }

    SECTION("Non-zero exit without hosts fails") {
        runner.setOutput("arp-scan", "ioctl: Operation not permitted\n", 1);
        auto outcome = discovery.discover(subnet(), {});
        REQUIRE(outcome.status == DiscoveryStatus::Failed);
        REQUIRE(outcome.hosts.empty());
    }

    SECTION("Stop requested before running") {
        runner.setOutput("arp-scan", kArpScanOutput);
        std::atomic<bool> stop{true};
        auto outcome = discovery.discover(subnet(), {nullptr, &stop});
        REQUIRE(outcome.status == DiscoveryStatus::Failed);
        REQUIRE(runner.calls().empty());
    }
}
