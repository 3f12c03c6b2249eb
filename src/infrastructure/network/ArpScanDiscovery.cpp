#include "infrastructure/network/ArpScanDiscovery.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

namespace netledger::infra {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

ArpScanDiscovery::ArpScanDiscovery(core::ICommandRunner& runner, Options options)
    : runner_(runner), options_(std::move(options)) {}

core::DiscoveryOutcome ArpScanDiscovery::discover(const core::Subnet& subnet,
                                                  const core::DiscoveryContext& context) {
    if (context.stopping()) {
        return core::DiscoveryOutcome::failed("stop requested");
    }
    if (!runner_.isAvailable("arp-scan")) {
        return core::DiscoveryOutcome::unavailable("arp-scan is not installed");
    }

    std::vector<std::string> argv = {"arp-scan", "--retry=2"};
    if (!options_.interfaceName.empty()) {
        argv.push_back("--interface=" + options_.interfaceName);
    }
    argv.push_back(subnet.toString());

    spdlog::info("ARP sweep of {}", subnet.toString());
    auto result = runner_.run(argv, options_.toolTimeout);

    if (result.status == core::CommandStatus::NotFound) {
        return core::DiscoveryOutcome::unavailable("arp-scan is not installed");
    }

    auto hosts = parseOutput(result.output);
    if (result.status == core::CommandStatus::TimedOut) {
        spdlog::warn("arp-scan timed out after {}s, keeping {} partial results",
                     options_.toolTimeout.count(), hosts.size());
        return core::DiscoveryOutcome::failed("arp-scan timed out", std::move(hosts));
    }
    if (!result.succeeded() && hosts.empty()) {
        auto message = trim(result.output);
        spdlog::warn("arp-scan failed (exit {}): {}", result.exitCode, message);
        return core::DiscoveryOutcome::failed("arp-scan exited with " +
                                              std::to_string(result.exitCode));
    }

    spdlog::info("arp-scan found {} hosts", hosts.size());
    return {core::DiscoveryStatus::Ok, std::move(hosts), {}};
}

core::DiscoveryMap ArpScanDiscovery::parseOutput(const std::string& output) {
    core::DiscoveryMap hosts;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        auto firstTab = line.find('\t');
        if (firstTab == std::string::npos) {
            continue;
        }
        auto ip = core::Ipv4Address::parse(line.substr(0, firstTab));
        if (!ip) {
            continue;
        }

        auto secondTab = line.find('\t', firstTab + 1);
        auto mac = trim(line.substr(firstTab + 1, secondTab == std::string::npos
                                                      ? std::string::npos
                                                      : secondTab - firstTab - 1));
        if (mac.empty()) {
            continue;
        }

        core::DiscoveryInfo info;
        info.hardwareAddress = mac;
        info.source = "arp-scan";
        if (secondTab != std::string::npos) {
            auto vendor = trim(line.substr(secondTab + 1));
            // Duplicate replies are annotated "(DUP: n)" after the vendor
            auto dup = vendor.find("(DUP:");
            if (dup != std::string::npos) {
                vendor = trim(vendor.substr(0, dup));
            }
            if (!vendor.empty() && vendor != "(Unknown)") {
                info.vendor = vendor;
            }
        }
        hosts.emplace(*ip, std::move(info));
    }
    return hosts;
}

} // namespace netledger::infra
