/**
 * @file ScanSnapshot.hpp
 * @brief Transient result of one discovery and port-scan cycle.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief One discovered host with its resolved name, identity and open ports.
 */
struct SnapshotEntry {
    std::string ip;
    std::string hostname;
    std::string identity;
    std::vector<uint16_t> ports;       ///< Ascending, deduplicated
    std::optional<std::string> vendor; ///< NIC vendor from discovery
    bool portScanTimedOut{false};      ///< Ports were abandoned at the host deadline

    bool operator==(const SnapshotEntry& other) const = default;
};

/**
 * @brief Everything one scan run observed.
 *
 * Produced by the orchestrator only after every phase has completed and
 * consumed once by the reconciler.
 */
struct ScanSnapshot {
    std::chrono::system_clock::time_point timestamp;
    std::string subnet;                      ///< CIDR that was scanned
    std::string discoverySource;             ///< Source(s) that produced the host list
    std::vector<SnapshotEntry> entries;      ///< Sorted by IP
    std::set<std::string> observedIdentities;

    /**
     * @brief Union of every open port across entries, ascending.
     */
    [[nodiscard]] std::vector<uint16_t> allPorts() const;

    /**
     * @brief Total number of open ports across entries.
     */
    [[nodiscard]] size_t openPortCount() const;

    [[nodiscard]] bool empty() const { return entries.empty(); }
};

} // namespace netledger::core
