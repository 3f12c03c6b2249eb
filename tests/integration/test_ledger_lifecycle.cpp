#include <catch2/catch_test_macros.hpp>

#include "engine/KnowledgeBase.hpp"
#include "infrastructure/storage/LedgerFile.hpp"
#include "support/Fakes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace netledger::core;
using namespace netledger::engine;
using netledger::testing::TempDir;

namespace {

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

ScanSnapshot snapshotOf(std::vector<SnapshotEntry> entries) {
    ScanSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.subnet = "10.0.0.0/24";
    snapshot.discoverySource = "arp-scan";
    snapshot.entries = std::move(entries);
    for (const auto& entry : snapshot.entries) {
        snapshot.observedIdentities.insert(entry.identity);
    }
    return snapshot;
}

SnapshotEntry seen(const std::string& ip, const std::string& identity,
                   std::vector<uint16_t> ports = {}) {
    return {ip, "host-" + ip, identity, std::move(ports), std::nullopt, false};
}

KnowledgeBasePaths pathsIn(const TempDir& dir) {
    return {dir / "netkb.csv", dir / "livestatus.csv", {}};
}

} // namespace

TEST_CASE("Legacy ledger is carried forward", "[integration][ledger]") {
    TempDir dir;
    writeText(dir / "netkb.csv",
              "MAC Address,IPs,Hostnames,Alive,Ports,Failed_Pings,Owner\n"
              "STANDALONE,,,0,,0,\n"
              "aa:bb:cc:00:00:01,10.0.0.1,gateway,1,53,0,netops\n"
              "aa:bb:cc:00:00:02,10.0.0.2,printer,1,631,4,office\n"
              "AA-BB-CC-00-00-03,10.0.0.3,nas,1,22,6,home\n");

    KnowledgeBase kb(pathsIn(dir), {});
    auto report = kb.reconcile(snapshotOf({seen("10.0.0.1", "AA:BB:CC:00:00:01", {53, 80}),
                                           seen("10.0.0.3", "aa:bb:cc:00:00:03", {22})}));

    auto ledger = kb.ledger();
    REQUIRE(ledger.extraColumns == std::vector<std::string>{"Owner"});

    const auto& gateway = ledger.records.at("aa:bb:cc:00:00:01");
    REQUIRE(gateway.ports == std::set<uint16_t>{53, 80});
    REQUIRE(gateway.hostnames == std::set<std::string>{"gateway", "host-10.0.0.1"});
    REQUIRE(gateway.extra.at("Owner") == "netops");

    const auto& printer = ledger.records.at("aa:bb:cc:00:00:02");
    REQUIRE(printer.failedPings == 5);
    REQUIRE(printer.alive);

    // An upper-case dash-separated row matches the host's own observation
    REQUIRE(ledger.size() == 4);
    REQUIRE(ledger.records.count("AA-BB-CC-00-00-03") == 0);
    const auto& nas = ledger.records.at("aa:bb:cc:00:00:03");
    REQUIRE(nas.ips == std::set<std::string>{"10.0.0.3"});
    REQUIRE(nas.failedPings == 0);
    REQUIRE(nas.extra.at("Owner") == "home");

    REQUIRE(ledger.records.at(std::string(kSentinelIdentity)).failedPings == 0);
    REQUIRE(report.liveStatus.totalKnownCount == 3);
    REQUIRE(report.liveStatus.aliveCount == 3);

    // Rewritten with the current header
    REQUIRE(readText(dir / "netkb.csv").rfind("Identity,IPs,Hostnames,Alive,Ports,FailedPings,Owner", 0) == 0);
}

TEST_CASE("Host lifecycle across many cycles", "[integration][ledger]") {
    TempDir dir;
    ReconcileOptions options;
    options.failedPingThreshold = 3;
    KnowledgeBase kb(pathsIn(dir), options);

    kb.reconcile(snapshotOf({seen("10.0.0.1", "aa:bb:cc:00:00:01", {22}),
                             seen("10.0.0.2", "aa:bb:cc:00:00:02", {80})}));

    SECTION("Absent host goes offline at the threshold and is kept") {
        std::vector<std::string> offline;
        for (int cycle = 0; cycle < 5; ++cycle) {
            auto report = kb.reconcile(snapshotOf({seen("10.0.0.1", "aa:bb:cc:00:00:01")}));
            offline.insert(offline.end(), report.wentOffline.begin(), report.wentOffline.end());
        }
        REQUIRE(offline == std::vector<std::string>{"aa:bb:cc:00:00:02"});

        auto ledger = kb.ledger();
        REQUIRE(ledger.records.at("aa:bb:cc:00:00:02").failedPings == 5);
        REQUIRE_FALSE(ledger.records.at("aa:bb:cc:00:00:02").alive);
        REQUIRE(kb.liveStatus() == LiveStatus{1, 1, 2});

        SECTION("and comes back when seen again") {
            auto report = kb.reconcile(snapshotOf({seen("10.0.0.2", "aa:bb:cc:00:00:02")}));
            REQUIRE(report.wentOffline.empty());
            REQUIRE(kb.ledger().records.at("aa:bb:cc:00:00:02").alive);
            REQUIRE(kb.ledger().records.at("aa:bb:cc:00:00:02").failedPings == 0);
        }
    }

    SECTION("Host seen at a second address is dropped") {
        auto report = kb.reconcile(snapshotOf({seen("10.0.0.1", "aa:bb:cc:00:00:01"),
                                               seen("10.0.0.9", "aa:bb:cc:00:00:02")}));
        REQUIRE(report.prunedAmbiguous == std::vector<std::string>{"aa:bb:cc:00:00:02"});
        REQUIRE(kb.ledger().records.count("aa:bb:cc:00:00:02") == 0);
    }
}

TEST_CASE("Corrupt ledger is set aside", "[integration][ledger]") {
    TempDir dir;
    writeText(dir / "netkb.csv", "Something,Else\n1,2\n");

    KnowledgeBase kb(pathsIn(dir), {});
    kb.reconcile(snapshotOf({seen("10.0.0.1", "aa:bb:cc:00:00:01")}));

    REQUIRE(readText(dir / "netkb.csv.corrupt") == "Something,Else\n1,2\n");
    REQUIRE(kb.ledger().size() == 1);
}
