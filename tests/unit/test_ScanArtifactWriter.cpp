#include <catch2/catch_test_macros.hpp>

#include "infrastructure/storage/ScanArtifactWriter.hpp"
#include "support/Fakes.hpp"

#include <fstream>

using namespace netledger::core;
using namespace netledger::infra;
using netledger::testing::TempDir;

namespace {

ScanSnapshot sampleSnapshot() {
    ScanSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.subnet = "192.168.1.0/24";
    snapshot.entries.push_back(
        {"192.168.1.1", "router", "aa:bb:cc:dd:ee:01", {22, 80}, "Acme, Inc.", false});
    snapshot.entries.push_back(
        {"192.168.1.20", "host-192-168-1-20", "00:00:c0:a8:01:14", {80, 443}, std::nullopt, false});
    return snapshot;
}

} // namespace

TEST_CASE("ScanArtifactWriter rows", "[ScanArtifactWriter]") {
    auto snapshot = sampleSnapshot();

    SECTION("Scan rows") {
        auto rows = ScanArtifactWriter::scanRows(snapshot);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0] == std::vector<std::string>{"IP", "Hostname", "Identity", "Vendor"});
        REQUIRE(rows[1] ==
                std::vector<std::string>{"192.168.1.1", "router", "aa:bb:cc:dd:ee:01", "Acme, Inc."});
        REQUIRE(rows[2][3].empty());
    }

    SECTION("Result rows have one column per port seen") {
        auto rows = ScanArtifactWriter::resultRows(snapshot);
        REQUIRE(rows[0] == std::vector<std::string>{"IP", "Hostname", "Alive", "Identity", "22",
                                                    "80", "443"});
        REQUIRE(rows[1] == std::vector<std::string>{"192.168.1.1", "router", "1",
                                                    "aa:bb:cc:dd:ee:01", "22", "80", ""});
        REQUIRE(rows[2] == std::vector<std::string>{"192.168.1.20", "host-192-168-1-20", "1",
                                                    "00:00:c0:a8:01:14", "", "80", "443"});
    }

    SECTION("Stem names the network and time") {
        auto stem = ScanArtifactWriter::artifactStem(snapshot);
        REQUIRE(stem.rfind("192.168.1.0_24_", 0) == 0);
        REQUIRE(stem.size() == std::string("192.168.1.0_24_").size() + 15);
    }
}

TEST_CASE("ScanArtifactWriter writes and prunes", "[ScanArtifactWriter]") {
    TempDir dir;
    ScanArtifactWriter writer(dir / "scan_results");

    auto artifacts = writer.write(sampleSnapshot());
    REQUIRE(std::filesystem::exists(artifacts.scanFile));
    REQUIRE(std::filesystem::exists(artifacts.resultFile));
    REQUIRE(artifacts.scanFile.filename().string().rfind("scan_192.168.1.0_24_", 0) == 0);
    REQUIRE(artifacts.resultFile.filename().string().rfind("result_192.168.1.0_24_", 0) == 0);

    SECTION("Prune keeps the newest files") {
        auto now = std::filesystem::file_time_type::clock::now();
        for (int i = 0; i < 5; ++i) {
            auto path = writer.directory() / ("old_" + std::to_string(i) + ".csv");
            std::ofstream(path) << "x\n";
            std::filesystem::last_write_time(path, now - std::chrono::hours(10 - i));
        }
        std::filesystem::last_write_time(artifacts.scanFile, now);
        std::filesystem::last_write_time(artifacts.resultFile, now);

        REQUIRE(writer.prune(3) == 4);
        REQUIRE(std::filesystem::exists(artifacts.scanFile));
        REQUIRE(std::filesystem::exists(artifacts.resultFile));
        REQUIRE(std::filesystem::exists(writer.directory() / "old_4.csv"));
        REQUIRE_FALSE(std::filesystem::exists(writer.directory() / "old_0.csv"));
    }

    SECTION("Nothing to prune") {
        REQUIRE(writer.prune(20) == 0);
    }
}

TEST_CASE("Host state export", "[ScanArtifactWriter]") {
    std::vector<HostStateView> hosts = {
        {"aa:bb:cc:dd:ee:01", "10.0.0.1", "router", {22, 80}, true}};
    auto j = hostStatesToJson(hosts, std::chrono::system_clock::now());

    REQUIRE(j.contains("updated_at"));
    REQUIRE(j["hosts"].size() == 1);
    REQUIRE(j["hosts"][0]["identity"] == "aa:bb:cc:dd:ee:01");
    REQUIRE(j["hosts"][0]["ports"] == nlohmann::json::array({22, 80}));
    REQUIRE(j["hosts"][0]["alive"] == true);

    TempDir dir;
    REQUIRE(writeHostStates(dir / "host_states.json", hosts, std::chrono::system_clock::now()));
    std::ifstream in(dir / "host_states.json");
    auto reread = nlohmann::json::parse(in);
    REQUIRE(reread["hosts"][0]["hostname"] == "router");
}
