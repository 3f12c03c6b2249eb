#include "core/types/ScanSnapshot.hpp"

namespace netledger::core {

std::vector<uint16_t> ScanSnapshot::allPorts() const {
    std::set<uint16_t> ports;
    for (const auto& entry : entries) {
        ports.insert(entry.ports.begin(), entry.ports.end());
    }
    return {ports.begin(), ports.end()};
}

size_t ScanSnapshot::openPortCount() const {
    size_t count = 0;
    for (const auto& entry : entries) {
        count += entry.ports.size();
    }
    return count;
}

} // namespace netledger::core
