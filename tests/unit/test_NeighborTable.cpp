#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NeighborTable.hpp"
#include "support/Fakes.hpp"

#include <fstream>
#include <sstream>

using namespace netledger::core;
using namespace netledger::infra;
using netledger::testing::TempDir;

namespace {

const char* kProcNetArp =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.1      0x1         0x2         00:11:22:33:44:55     *        eth0\n"
    "192.168.1.9      0x1         0x0         00:00:00:00:00:00     *        eth0\n"
    "192.168.1.12     0x1         0x6         aa:bb:cc:dd:ee:01     *        eth0\n"
    "garbage\n";

} // namespace

TEST_CASE("Neighbor table parsing", "[NeighborTable]") {
    std::istringstream input(kProcNetArp);
    auto entries = NeighborTable::parse(input);

    REQUIRE(entries.size() == 2);
    REQUIRE(entries.at(*Ipv4Address::parse("192.168.1.1")) == "00:11:22:33:44:55");
    REQUIRE(entries.at(*Ipv4Address::parse("192.168.1.12")) == "aa:bb:cc:dd:ee:01");
    REQUIRE(entries.count(*Ipv4Address::parse("192.168.1.9")) == 0);
}

TEST_CASE("Neighbor table refresh and lookup", "[NeighborTable]") {
    TempDir dir;
    auto path = dir / "arp";

    SECTION("Reads the file") {
        {
            std::ofstream out(path);
            out << kProcNetArp;
        }
        NeighborTable table(path.string());
        REQUIRE(table.refresh() == 2);
        REQUIRE(table.lookup(*Ipv4Address::parse("192.168.1.1")) == "00:11:22:33:44:55");
        REQUIRE_FALSE(table.lookup(*Ipv4Address::parse("192.168.1.200")).has_value());
    }

    SECTION("Missing file yields an empty table") {
        NeighborTable table(path.string());
        REQUIRE(table.refresh() == 0);
        REQUIRE_FALSE(table.lookup(*Ipv4Address::parse("192.168.1.1")).has_value());
    }
}
