/**
 * @file PingResult.hpp
 * @brief Result of a single reachability probe.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netledger::core {

/**
 * @brief Result of one ICMP echo probe.
 *
 * Contains timing, success status and the reason a probe did not succeed.
 */
struct PingResult {
    std::string address;                  ///< Address that was probed
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};                  ///< Whether an echo reply was received
    std::optional<int> ttl;               ///< Time-to-live from the reply (raw socket only)
    std::string method;                   ///< "raw" or "ping-utility"
    std::string errorMessage;             ///< Why the probe failed, if it did

    bool operator==(const PingResult& other) const = default;
};

} // namespace netledger::core
