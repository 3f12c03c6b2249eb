/**
 * @file PortScanResult.hpp
 * @brief Port scanning requests and per-host scan outcomes.
 *
 * A probe counts a port as open only when a connection is established;
 * refused, filtered and failed probes are simply not open.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief Describes which ports to probe on one host and how.
 *
 * The probed set is the inclusive range [rangeStart, rangeEnd] plus every
 * entry of extraPorts, deduplicated. Values outside 1-65535 are discarded and
 * an inverted range contributes nothing.
 */
struct PortScanRequest {
    int rangeStart{1};                        ///< First port of the range (inclusive)
    int rangeEnd{1000};                       ///< Last port of the range (inclusive)
    std::vector<int> extraPorts;              ///< Additional explicit ports
    std::chrono::milliseconds probeTimeout{2000}; ///< Timeout for a single probe
    int maxConcurrentProbes{50};              ///< Probes in flight per host

    /**
     * @brief Gets the ports to probe, ascending and deduplicated.
     */
    [[nodiscard]] std::vector<uint16_t> portsToScan() const;

    /**
     * @brief Formats the port set as an nmap-style list ("1-1000,3306,8080").
     */
    [[nodiscard]] std::string toPortSpec() const;
};

/**
 * @brief Outcome of scanning one host.
 */
struct PortScanOutcome {
    std::vector<uint16_t> openPorts; ///< Ascending
    bool timedOut{false};            ///< The host deadline passed before the scan finished
    std::string method;              ///< Scanner that produced the result

    bool operator==(const PortScanOutcome& other) const = default;
};

} // namespace netledger::core
