/**
 * @file ScanOrchestrator.hpp
 * @brief Runs the discovery and port-scan phases of one cycle.
 */

#pragma once

#include "core/identity/HostnameResolverChain.hpp"
#include "core/services/IDiscoverySource.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/types/ScanSnapshot.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netledger::engine {

/**
 * @brief Which discovery sources a cycle uses. Any slot may be empty.
 */
struct DiscoveryPlan {
    std::shared_ptr<core::IDiscoverySource> primary;
    std::shared_ptr<core::IDiscoverySource> fallback;      ///< Runs when primary is unavailable or failed
    std::shared_ptr<core::IDiscoverySource> supplementary; ///< Runs after primary/fallback
};

/**
 * @brief Limits and filters for the port-scan phase.
 */
struct ScanOptions {
    size_t workers{4};
    std::chrono::seconds hostTimeout{30};
    core::PortScanRequest request;
    bool blacklistEnabled{false};
    std::set<std::string> blacklistMacs;
    std::set<std::string> blacklistIps;
};

/**
 * @brief Merged result of the discovery phase.
 */
struct DiscoveryResult {
    core::DiscoveryMap hosts;
    std::string source; ///< "+"-joined names of the sources that ran
};

/**
 * @brief Drives one scan cycle through its sequential phases.
 *
 * Discovery, then one port-scan and name-resolution unit per host on a
 * bounded worker pool, then hostname backfill. Each phase completes before
 * the next starts. Cancellation is cooperative through the stop flag.
 */
class ScanOrchestrator {
public:
    ScanOrchestrator(DiscoveryPlan plan, std::shared_ptr<core::IPortScanner> scanner,
                     std::shared_ptr<const core::HostnameResolverChain> names,
                     ScanOptions options);

    /**
     * @brief Runs every phase for a subnet.
     * @return The snapshot, or nullopt if a stop was requested during discovery.
     * @throws core::DiscoveryUnavailableError if no discovery source could run.
     */
    std::optional<core::ScanSnapshot> run(const core::Subnet& subnet,
                                          const std::atomic<bool>& stopRequested);

    /**
     * @brief Discovery phase: primary, fallback if needed, then supplementary.
     * @return nullopt if a stop was requested before the phase finished.
     * @throws core::DiscoveryUnavailableError if every configured source is unavailable.
     */
    std::optional<DiscoveryResult> discover(const core::Subnet& subnet,
                                            const std::atomic<bool>& stopRequested);

    /**
     * @brief Port-scan phase over discovered hosts.
     *
     * Hosts whose unit never started (stop requested) keep zero ports.
     * @return Entries in address order with hostnames backfilled.
     */
    std::vector<core::SnapshotEntry> scanHosts(const core::DiscoveryMap& hosts,
                                               const std::atomic<bool>& stopRequested);

    [[nodiscard]] const ScanOptions& options() const { return options_; }

private:
    bool isBlacklisted(core::Ipv4Address ip, const core::DiscoveryInfo& info) const;
    void scanOne(core::SnapshotEntry& entry);

    DiscoveryPlan plan_;
    std::shared_ptr<core::IPortScanner> scanner_;
    std::shared_ptr<const core::HostnameResolverChain> names_;
    ScanOptions options_;
    std::set<std::string> normalizedBlacklistMacs_;
};

} // namespace netledger::engine
