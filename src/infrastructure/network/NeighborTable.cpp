#include "infrastructure/network/NeighborTable.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace netledger::infra {

namespace {

constexpr int ATF_COMPLETE = 0x2;

} // namespace

NeighborTable::NeighborTable(std::string path) : path_(std::move(path)) {}

size_t NeighborTable::refresh() {
    std::ifstream file(path_);
    if (!file) {
        spdlog::debug("Neighbor table {} not readable", path_);
        return 0;
    }
    auto parsed = parse(file);

    std::lock_guard lock(mutex_);
    entries_ = std::move(parsed);
    return entries_.size();
}

std::optional<std::string> NeighborTable::lookup(core::Ipv4Address ip) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(ip);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<core::Ipv4Address, std::string> NeighborTable::parse(std::istream& input) {
    std::map<core::Ipv4Address, std::string> entries;
    std::string line;

    // Header: IP address  HW type  Flags  HW address  Mask  Device
    std::getline(input, line);

    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string ipText, hwType, flagsText, hwAddress;
        if (!(fields >> ipText >> hwType >> flagsText >> hwAddress)) {
            continue;
        }

        auto ip = core::Ipv4Address::parse(ipText);
        if (!ip) {
            continue;
        }
        int flags = static_cast<int>(std::strtol(flagsText.c_str(), nullptr, 16));
        if ((flags & ATF_COMPLETE) == 0 || hwAddress == "00:00:00:00:00:00") {
            continue;
        }
        entries[*ip] = hwAddress;
    }
    return entries;
}

} // namespace netledger::infra
