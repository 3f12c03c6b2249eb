#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "infrastructure/network/NmapSynPortScanner.hpp"
#include "support/Fakes.hpp"

#include <algorithm>

using namespace netledger::core;
using namespace netledger::infra;
using netledger::testing::FakeCommandRunner;

namespace {

IPortScanner::Deadline inSeconds(int seconds) {
    return std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
}

} // namespace

TEST_CASE("nmap grepable output parsing", "[NmapSynPortScanner]") {
    SECTION("Open tcp ports are extracted in order") {
        auto ports = NmapSynPortScanner::parseGrepableOutput(
            "# Nmap 7.94 scan initiated as: nmap -sS -oG - 10.0.0.5\n"
            "Host: 10.0.0.5 ()\tStatus: Up\n"
            "Host: 10.0.0.5 ()\tPorts: 443/open/tcp//https///, 22/open/tcp//ssh///, "
            "80/open/tcp//http///\tIgnored State: closed (997)\n"
            "# Nmap done at Wed May  1 10:00:00 2024 -- 1 IP address (1 host up)\n");
        REQUIRE(ports == std::vector<uint16_t>{22, 80, 443});
    }

    SECTION("Closed, filtered and udp entries are skipped") {
        auto ports = NmapSynPortScanner::parseGrepableOutput(
            "Host: 10.0.0.5 ()\tPorts: 21/closed/tcp//ftp///, 25/filtered/tcp//smtp///, "
            "53/open/udp//domain///, 8080/open/tcp//http-proxy///\n");
        REQUIRE(ports == std::vector<uint16_t>{8080});
    }

    SECTION("Malformed entries are ignored") {
        auto ports = NmapSynPortScanner::parseGrepableOutput(
            "Host: 10.0.0.5 ()\tPorts: abc/open/tcp//x///, 70000/open/tcp//y///, 22/open/tcp//ssh///\n");
        REQUIRE(ports == std::vector<uint16_t>{22});
    }

    SECTION("No ports line") {
        REQUIRE(NmapSynPortScanner::parseGrepableOutput("Host: 10.0.0.5 ()\tStatus: Down\n").empty());
    }
}

TEST_CASE("SYN scan outcomes", "[NmapSynPortScanner]") {
    FakeCommandRunner runner;
    NmapSynPortScanner scanner(runner);
    PortScanRequest request;

    SECTION("Successful scan") {
        runner.setOutput("nmap", "Host: 10.0.0.5 ()\tPorts: 22/open/tcp//ssh///\n");
        auto outcome = scanner.scanPorts("10.0.0.5", request, inSeconds(30));

        REQUIRE(outcome.openPorts == std::vector<uint16_t>{22});
        REQUIRE_FALSE(outcome.timedOut);
        REQUIRE(outcome.method == "syn");

        auto argv = runner.calls().at(0);
        REQUIRE(argv.front() == "nmap");
        REQUIRE(argv.back() == "10.0.0.5");
        REQUIRE(std::find(argv.begin(), argv.end(), "-sS") != argv.end());
        REQUIRE(std::find(argv.begin(), argv.end(), "1-1000") != argv.end());
    }

    SECTION("Missing privileges") {
        runner.setOutput("nmap",
                         "You requested a scan type which requires root privileges.\nQUITTING!\n",
                         1);
        REQUIRE_THROWS_AS(scanner.scanPorts("10.0.0.5", request, inSeconds(30)), PrivilegeError);
    }

    SECTION("nmap not installed") {
        REQUIRE_THROWS_AS(scanner.scanPorts("10.0.0.5", request, inSeconds(30)),
                          ToolUnavailableError);
    }

    SECTION("Tool timeout is reported as a timed-out scan") {
        runner.setResult("nmap", {CommandStatus::TimedOut, 124, ""});
        auto outcome = scanner.scanPorts("10.0.0.5", request, inSeconds(30));
        REQUIRE(outcome.timedOut);
        REQUIRE(outcome.openPorts.empty());
    }

    SECTION("Expired deadline does not launch nmap") {
        runner.setOutput("nmap", "");
        auto outcome = scanner.scanPorts("10.0.0.5", request, inSeconds(-1));
        REQUIRE(outcome.timedOut);
        REQUIRE(runner.calls().empty());
    }

    SECTION("Other failures throw") {
        runner.setOutput("nmap", "Failed to resolve \"x\".\n", 2);
        REQUIRE_THROWS_AS(scanner.scanPorts("10.0.0.5", request, inSeconds(30)),
                          std::runtime_error);
    }
}
