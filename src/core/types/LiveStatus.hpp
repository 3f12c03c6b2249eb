/**
 * @file LiveStatus.hpp
 * @brief Summary counters computed from the ledger after each cycle.
 */

#pragma once

#include <cstdint>

namespace netledger::core {

/**
 * @brief Network-wide counters published in the summary file.
 */
struct LiveStatus {
    int64_t totalOpenPorts{0};  ///< Open ports summed over alive hosts
    int64_t aliveCount{0};      ///< Hosts currently alive
    int64_t totalKnownCount{0}; ///< Every known host, sentinel rows excluded

    bool operator==(const LiveStatus& other) const = default;
};

} // namespace netledger::core
