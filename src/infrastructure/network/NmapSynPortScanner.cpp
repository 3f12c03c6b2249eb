#include "infrastructure/network/NmapSynPortScanner.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace netledger::infra {

NmapSynPortScanner::NmapSynPortScanner(core::ICommandRunner& runner) : runner_(runner) {}

core::PortScanOutcome NmapSynPortScanner::scanPorts(const std::string& ip,
                                                    const core::PortScanRequest& request,
                                                    Deadline deadline) {
    core::PortScanOutcome outcome;
    outcome.method = name();

    auto budget = std::chrono::duration_cast<std::chrono::seconds>(
        deadline - std::chrono::steady_clock::now());
    if (budget.count() <= 0) {
        outcome.timedOut = true;
        return outcome;
    }

    auto spec = request.toPortSpec();
    if (spec.empty()) {
        return outcome;
    }

    std::vector<std::string> argv = {"nmap",    "-sS",  "-n",   "-Pn",
                                     "--open",  "-p",   spec,   "--host-timeout",
                                     std::to_string(budget.count()) + "s", "-oG", "-", ip};
    auto result = runner_.run(argv, budget);

    switch (result.status) {
    case core::CommandStatus::NotFound:
        throw core::ToolUnavailableError("nmap is not installed");
    case core::CommandStatus::LaunchFailed:
        throw core::ToolUnavailableError("nmap could not be started");
    case core::CommandStatus::TimedOut:
        outcome.timedOut = true;
        return outcome;
    case core::CommandStatus::Completed:
        break;
    }

    if (isPrivilegeRefusal(result.output)) {
        throw core::PrivilegeError("SYN scan requires root privileges");
    }
    if (result.exitCode != 0) {
        throw std::runtime_error("nmap exited with " + std::to_string(result.exitCode));
    }

    outcome.openPorts = parseGrepableOutput(result.output);
    spdlog::debug("SYN scan of {}: {} open ports", ip, outcome.openPorts.size());
    return outcome;
}

bool NmapSynPortScanner::isPrivilegeRefusal(const std::string& output) {
    return output.find("requires root privileges") != std::string::npos ||
           output.find("Operation not permitted") != std::string::npos;
}

std::vector<uint16_t> NmapSynPortScanner::parseGrepableOutput(const std::string& output) {
    std::set<uint16_t> ports;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        // Host: 10.0.0.5 ()	Ports: 22/open/tcp//ssh///, 80/open/tcp//http///
        auto marker = line.find("Ports: ");
        if (line.rfind("Host: ", 0) != 0 || marker == std::string::npos) {
            continue;
        }
        auto list = line.substr(marker + 7);
        auto tab = list.find('\t');
        if (tab != std::string::npos) {
            list = list.substr(0, tab);
        }

        std::istringstream entries(list);
        std::string entry;
        while (std::getline(entries, entry, ',')) {
            auto start = entry.find_first_not_of(' ');
            if (start == std::string::npos) {
                continue;
            }
            entry = entry.substr(start);

            std::vector<std::string> fields;
            std::istringstream parts(entry);
            std::string field;
            while (std::getline(parts, field, '/')) {
                fields.push_back(field);
            }
            if (fields.size() < 3 || fields[1] != "open" || fields[2] != "tcp") {
                continue;
            }
            try {
                int port = std::stoi(fields[0]);
                if (port >= 1 && port <= 65535) {
                    ports.insert(static_cast<uint16_t>(port));
                }
            } catch (const std::exception& e) {
                spdlog::debug("Ignoring malformed nmap port entry '{}': {}", entry, e.what());
            }
        }
    }
    return {ports.begin(), ports.end()};
}

} // namespace netledger::infra
