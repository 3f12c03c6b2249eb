#include "core/types/PortScanResult.hpp"

#include <algorithm>
#include <set>

namespace netledger::core {

namespace {

bool isValidPort(int port) {
    return port >= 1 && port <= 65535;
}

} // namespace

std::vector<uint16_t> PortScanRequest::portsToScan() const {
    std::set<uint16_t> ports;

    int first = std::max(rangeStart, 1);
    int last = std::min(rangeEnd, 65535);
    for (int p = first; p <= last; ++p) {
        ports.insert(static_cast<uint16_t>(p));
    }

    for (int p : extraPorts) {
        if (isValidPort(p)) {
            ports.insert(static_cast<uint16_t>(p));
        }
    }
    return {ports.begin(), ports.end()};
}

std::string PortScanRequest::toPortSpec() const {
    auto ports = portsToScan();
    std::string spec;

    // Collapse consecutive runs into "a-b" segments
    size_t i = 0;
    while (i < ports.size()) {
        size_t j = i;
        while (j + 1 < ports.size() && ports[j + 1] == ports[j] + 1) {
            ++j;
        }
        if (!spec.empty()) {
            spec += ',';
        }
        spec += std::to_string(ports[i]);
        if (j > i) {
            spec += '-' + std::to_string(ports[j]);
        }
        i = j + 1;
    }
    return spec;
}

} // namespace netledger::core
