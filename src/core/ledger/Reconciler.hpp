/**
 * @file Reconciler.hpp
 * @brief Merges a scan snapshot into the host ledger.
 *
 * This file defines the reconciliation algorithm that keeps the ledger
 * identity-stable across scans: it upserts observed hosts, ages hosts that
 * were not seen through the consecutive-failure counter, handles address
 * reassignment and drops records whose address mapping is ambiguous.
 */

#pragma once

#include "core/types/HostRecord.hpp"
#include "core/types/LiveStatus.hpp"
#include "core/types/ScanSnapshot.hpp"

#include <set>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief Tunables for one reconciliation pass.
 */
struct ReconcileOptions {
    int failedPingThreshold{15};        ///< failedPings at which a host counts as dead
    bool blacklistEnabled{false};
    std::set<std::string> identityBlacklist; ///< Hardware addresses, any accepted notation
    std::set<std::string> ipBlacklist;
};

/**
 * @brief What a reconciliation pass changed.
 */
struct ReconcileReport {
    std::vector<HostStateView> upserted;       ///< Hosts written from the snapshot, after pruning
    std::vector<std::string> wentOffline;      ///< Identities whose alive flag flipped to false
    std::vector<std::string> prunedAmbiguous;  ///< Identities removed for not holding exactly one IP
    int reassignments{0};                      ///< IPs that moved to another identity this pass
    int skipped{0};                            ///< Snapshot entries ignored (sentinel, blacklist, invalid)
    LiveStatus liveStatus;                     ///< Counters over the resulting ledger
};

/**
 * @brief The ledger merge algorithm.
 *
 * Reconciler is a pure function over values: it mutates only the ledger it is
 * handed. Callers serialize access to a shared ledger themselves.
 */
class Reconciler {
public:
    explicit Reconciler(ReconcileOptions options = {});

    /**
     * @brief Merges a snapshot into the ledger in place.
     *
     * Steps, in order: upsert every usable snapshot entry (resetting its
     * failure counter), increment the counter of every identity not observed,
     * then drop records that do not hold exactly one IP.
     */
    ReconcileReport reconcile(Ledger& ledger, const ScanSnapshot& snapshot) const;

    /**
     * @brief Liveness rule shared by absence and reassignment.
     */
    static bool isAlive(int failedPings, int threshold) { return failedPings < threshold; }

    [[nodiscard]] const ReconcileOptions& options() const { return options_; }

private:
    bool isBlacklisted(const std::string& identity, const std::string& ip) const;

    ReconcileOptions options_;
    std::set<std::string> normalizedIdentityBlacklist_;
};

} // namespace netledger::core
