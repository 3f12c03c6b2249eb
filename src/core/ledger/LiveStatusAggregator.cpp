#include "core/ledger/LiveStatusAggregator.hpp"

namespace netledger::core {

LiveStatus LiveStatusAggregator::aggregate(const Ledger& ledger) {
    LiveStatus status;
    for (const auto& [identity, record] : ledger.records) {
        if (!record.isSentinel()) {
            ++status.totalKnownCount;
        }
        if (record.alive) {
            ++status.aliveCount;
            status.totalOpenPorts += static_cast<int64_t>(record.ports.size());
        }
    }
    return status;
}

} // namespace netledger::core
