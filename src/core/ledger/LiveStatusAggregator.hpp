/**
 * @file LiveStatusAggregator.hpp
 * @brief Computes network-wide counters from the ledger.
 */

#pragma once

#include "core/types/HostRecord.hpp"
#include "core/types/LiveStatus.hpp"

namespace netledger::core {

class LiveStatusAggregator {
public:
    /**
     * @brief Tallies open ports and alive hosts over alive rows, and all
     *        non-sentinel rows as known hosts.
     */
    static LiveStatus aggregate(const Ledger& ledger);
};

} // namespace netledger::core
