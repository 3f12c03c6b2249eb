#include "core/ledger/Reconciler.hpp"

#include "core/identity/IdentityResolver.hpp"
#include "core/ledger/LiveStatusAggregator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

namespace netledger::core {

namespace {

bool isSentinelEntry(const SnapshotEntry& entry) {
    return entry.identity == kSentinelIdentity || entry.ip == kSentinelIdentity ||
           entry.hostname == kSentinelIdentity;
}

bool isEmptyEntry(const SnapshotEntry& entry) {
    return entry.identity.empty() && entry.ip.empty() && entry.hostname.empty() &&
           entry.ports.empty();
}

// Hardware addresses compare in normalized form; anything else (pseudo
// identities included) is already canonical.
std::string canonicalObservedIdentity(const std::string& identity) {
    auto normalized = IdentityResolver::normalizeHardwareAddress(identity);
    return normalized ? *normalized : identity;
}

} // namespace

Reconciler::Reconciler(ReconcileOptions options) : options_(std::move(options)) {
    if (options_.failedPingThreshold < 1) {
        options_.failedPingThreshold = 1;
    }
    for (const auto& entry : options_.identityBlacklist) {
        normalizedIdentityBlacklist_.insert(canonicalObservedIdentity(entry));
    }
}

bool Reconciler::isBlacklisted(const std::string& identity, const std::string& ip) const {
    if (!options_.blacklistEnabled) {
        return false;
    }
    return normalizedIdentityBlacklist_.count(identity) > 0 || options_.ipBlacklist.count(ip) > 0;
}

ReconcileReport Reconciler::reconcile(Ledger& ledger, const ScanSnapshot& snapshot) const {
    ReconcileReport report;
    const int threshold = options_.failedPingThreshold;

    std::set<std::string> wasAlive;
    for (const auto& [identity, record] : ledger.records) {
        if (record.alive) {
            wasAlive.insert(identity);
        }
    }

    // ip -> identity, scoped to this pass only
    std::map<std::string, std::string> ipOwner;
    std::set<std::string> observed;
    std::vector<std::string> upsertOrder;

    for (const auto& entry : snapshot.entries) {
        if (isEmptyEntry(entry) || isSentinelEntry(entry)) {
            ++report.skipped;
            continue;
        }

        std::string identity;
        try {
            identity = IdentityResolver::resolve(
                entry.ip, entry.identity.empty() ? std::nullopt
                                                 : std::optional<std::string>(entry.identity));
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Skipping snapshot entry '{}': {}", entry.identity, e.what());
            ++report.skipped;
            continue;
        }

        if (isBlacklisted(identity, entry.ip)) {
            spdlog::debug("Skipping blacklisted host {} ({})", entry.ip, identity);
            ++report.skipped;
            continue;
        }

        auto owner = ipOwner.find(entry.ip);
        if (owner != ipOwner.end() && owner->second != identity) {
            auto previous = ledger.records.find(owner->second);
            if (previous != ledger.records.end()) {
                auto& prev = previous->second;
                prev.failedPings += 1;
                prev.alive = isAlive(prev.failedPings, threshold);
                spdlog::info("IP {} moved from {} to {} (failed pings of {} now {})", entry.ip,
                             owner->second, identity, owner->second, prev.failedPings);
            }
            ++report.reassignments;
        }
        ipOwner[entry.ip] = identity;

        auto [it, inserted] = ledger.records.try_emplace(identity);
        auto& record = it->second;
        if (inserted) {
            record.identity = identity;
            for (const auto& column : ledger.extraColumns) {
                record.extra.emplace(column, "");
            }
        }

        record.ips.insert(entry.ip);
        if (!entry.hostname.empty()) {
            record.hostnames.insert(entry.hostname);
        } else if (record.hostnames.empty()) {
            record.hostnames.insert(IdentityResolver::fallbackHostname(entry.ip));
        }
        record.ports.insert(entry.ports.begin(), entry.ports.end());
        record.failedPings = 0;
        record.alive = true;

        if (observed.insert(identity).second) {
            upsertOrder.push_back(identity);
        }
    }

    for (const auto& identity : snapshot.observedIdentities) {
        observed.insert(canonicalObservedIdentity(identity));
    }

    for (auto& [identity, record] : ledger.records) {
        if (record.isSentinel() || observed.count(identity) > 0) {
            continue;
        }
        record.failedPings += 1;
        record.alive = isAlive(record.failedPings, threshold);
    }

    for (auto it = ledger.records.begin(); it != ledger.records.end();) {
        const auto& record = it->second;
        if (!record.isSentinel() && record.ips.size() != 1) {
            spdlog::warn("Dropping {} from the ledger: holds {} IPs", it->first, record.ips.size());
            report.prunedAmbiguous.push_back(it->first);
            it = ledger.records.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& identity : wasAlive) {
        auto it = ledger.records.find(identity);
        if (it != ledger.records.end() && !it->second.alive) {
            spdlog::info("Host {} marked offline after {} consecutive failed pings", identity,
                         it->second.failedPings);
            report.wentOffline.push_back(identity);
        }
    }

    for (const auto& identity : upsertOrder) {
        auto it = ledger.records.find(identity);
        if (it != ledger.records.end()) {
            report.upserted.push_back(HostStateView::fromRecord(it->second));
        }
    }

    report.liveStatus = LiveStatusAggregator::aggregate(ledger);
    return report;
}

} // namespace netledger::core
