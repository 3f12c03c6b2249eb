#include "infrastructure/network/NmapDiscovery.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

namespace netledger::infra {

NmapDiscovery::NmapDiscovery(core::ICommandRunner& runner, std::chrono::seconds toolTimeout)
    : runner_(runner), toolTimeout_(toolTimeout) {}

core::DiscoveryOutcome NmapDiscovery::discover(const core::Subnet& subnet,
                                               const core::DiscoveryContext& context) {
    if (context.stopping()) {
        return core::DiscoveryOutcome::failed("stop requested");
    }
    if (!runner_.isAvailable("nmap")) {
        return core::DiscoveryOutcome::unavailable("nmap is not installed");
    }

    spdlog::info("nmap host discovery of {}", subnet.toString());
    auto result = runner_.run({"nmap", "-sn", subnet.toString()}, toolTimeout_);

    if (result.status == core::CommandStatus::NotFound) {
        return core::DiscoveryOutcome::unavailable("nmap is not installed");
    }

    auto hosts = parseOutput(result.output);
    if (result.status == core::CommandStatus::TimedOut) {
        spdlog::warn("nmap -sn timed out, keeping {} partial results", hosts.size());
        return core::DiscoveryOutcome::failed("nmap timed out", std::move(hosts));
    }
    if (!result.succeeded()) {
        spdlog::warn("nmap host discovery failed (exit {})", result.exitCode);
        return core::DiscoveryOutcome::failed("nmap exited with " + std::to_string(result.exitCode),
                                              std::move(hosts));
    }

    spdlog::info("nmap found {} hosts", hosts.size());
    return {core::DiscoveryStatus::Ok, std::move(hosts), {}};
}

core::DiscoveryMap NmapDiscovery::parseOutput(const std::string& output) {
    static const std::regex reportWithName(R"(^Nmap scan report for (\S+) \((\d+\.\d+\.\d+\.\d+)\))");
    static const std::regex reportBare(R"(^Nmap scan report for (\d+\.\d+\.\d+\.\d+)\s*$)");
    static const std::regex macLine(R"(^MAC Address: ([0-9A-Fa-f:]{17})(?: \((.*)\))?)");

    core::DiscoveryMap hosts;
    core::DiscoveryInfo* current = nullptr;

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::smatch match;
        if (std::regex_search(line, match, reportWithName)) {
            current = nullptr;
            if (auto ip = core::Ipv4Address::parse(match[2].str())) {
                auto& info = hosts[*ip];
                info.source = "nmap";
                info.hostname = match[1].str();
                current = &info;
            }
        } else if (std::regex_search(line, match, reportBare)) {
            current = nullptr;
            if (auto ip = core::Ipv4Address::parse(match[1].str())) {
                auto& info = hosts[*ip];
                info.source = "nmap";
                current = &info;
            }
        } else if (current != nullptr && std::regex_search(line, match, macLine)) {
            current->hardwareAddress = match[1].str();
            if (match[2].matched && match[2].str() != "Unknown") {
                current->vendor = match[2].str();
            }
        }
    }
    return hosts;
}

} // namespace netledger::infra
