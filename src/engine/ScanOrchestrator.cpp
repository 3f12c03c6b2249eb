#include "engine/ScanOrchestrator.hpp"

#include "core/Errors.hpp"
#include "core/identity/IdentityResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <utility>

namespace netledger::engine {

using namespace netledger::core;

ScanOrchestrator::ScanOrchestrator(DiscoveryPlan plan, std::shared_ptr<IPortScanner> scanner,
                                   std::shared_ptr<const HostnameResolverChain> names,
                                   ScanOptions options)
    : plan_(std::move(plan)), scanner_(std::move(scanner)), names_(std::move(names)),
      options_(std::move(options)) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
    for (const auto& mac : options_.blacklistMacs) {
        if (auto normalized = IdentityResolver::normalizeHardwareAddress(mac)) {
            normalizedBlacklistMacs_.insert(*normalized);
        } else {
            spdlog::warn("Ignoring malformed blacklisted hardware address '{}'", mac);
        }
    }
}

std::optional<ScanSnapshot> ScanOrchestrator::run(const Subnet& subnet,
                                                  const std::atomic<bool>& stopRequested) {
    auto started = std::chrono::steady_clock::now();
    ScanSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.subnet = subnet.toString();

    auto discovered = discover(subnet, stopRequested);
    if (!discovered) {
        spdlog::warn("Stop requested during discovery of {}, abandoning cycle", snapshot.subnet);
        return std::nullopt;
    }
    snapshot.discoverySource = discovered->source;
    spdlog::info("Discovered {} hosts on {} via {}", discovered->hosts.size(), snapshot.subnet,
                 discovered->source.empty() ? "none" : discovered->source);

    snapshot.entries = scanHosts(discovered->hosts, stopRequested);
    for (const auto& entry : snapshot.entries) {
        snapshot.observedIdentities.insert(entry.identity);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Scan of {} finished in {} ms: {} hosts, {} open ports", snapshot.subnet,
                 elapsed.count(), snapshot.entries.size(), snapshot.openPortCount());
    return snapshot;
}

std::optional<DiscoveryResult> ScanOrchestrator::discover(const Subnet& subnet,
                                                          const std::atomic<bool>& stopRequested) {
    DiscoveryResult result;
    int configured = 0;
    int unavailable = 0;

    auto runSource = [&](IDiscoverySource& source) {
        DiscoveryContext context{&result.hosts, &stopRequested};
        ++configured;
        auto outcome = source.discover(subnet, context);

        switch (outcome.status) {
        case DiscoveryStatus::Ok:
            spdlog::debug("{} found {} hosts", source.name(), outcome.hosts.size());
            break;
        case DiscoveryStatus::Unavailable:
            ++unavailable;
            spdlog::warn("{} unavailable: {}", source.name(), outcome.message);
            break;
        case DiscoveryStatus::Failed:
            spdlog::warn("{} failed ({} partial hosts): {}", source.name(), outcome.hosts.size(),
                         outcome.message);
            break;
        }

        if (outcome.status != DiscoveryStatus::Unavailable) {
            if (!result.source.empty()) {
                result.source += '+';
            }
            result.source += source.name();
        }

        // Earlier sources win for addresses they already reported
        for (auto& [ip, info] : outcome.hosts) {
            result.hosts.emplace(ip, std::move(info));
        }
        return outcome.status;
    };

    if (plan_.primary) {
        auto status = runSource(*plan_.primary);
        if (stopRequested.load()) {
            return std::nullopt;
        }
        if (status != DiscoveryStatus::Ok && plan_.fallback) {
            spdlog::info("Falling back to {} discovery", plan_.fallback->name());
            runSource(*plan_.fallback);
        }
    } else if (plan_.fallback) {
        runSource(*plan_.fallback);
    }

    if (stopRequested.load()) {
        return std::nullopt;
    }

    if (plan_.supplementary) {
        runSource(*plan_.supplementary);
        if (stopRequested.load()) {
            return std::nullopt;
        }
    }

    if (configured == unavailable) {
        throw DiscoveryUnavailableError(
            configured == 0 ? "No discovery source is enabled"
                            : "No discovery source can run on this machine");
    }

    if (options_.blacklistEnabled) {
        for (auto it = result.hosts.begin(); it != result.hosts.end();) {
            if (isBlacklisted(it->first, it->second)) {
                spdlog::debug("Skipping blacklisted host {}", it->first.toString());
                it = result.hosts.erase(it);
            } else {
                ++it;
            }
        }
    }
    return result;
}

bool ScanOrchestrator::isBlacklisted(Ipv4Address ip, const DiscoveryInfo& info) const {
    if (options_.blacklistIps.count(ip.toString()) > 0) {
        return true;
    }
    if (info.hardwareAddress) {
        auto normalized = IdentityResolver::normalizeHardwareAddress(*info.hardwareAddress);
        if (normalized && normalizedBlacklistMacs_.count(*normalized) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<SnapshotEntry> ScanOrchestrator::scanHosts(const DiscoveryMap& hosts,
                                                       const std::atomic<bool>& stopRequested) {
    std::vector<SnapshotEntry> entries;
    entries.reserve(hosts.size());
    for (const auto& [ip, info] : hosts) {
        SnapshotEntry entry;
        entry.ip = ip.toString();
        entry.identity = IdentityResolver::resolve(entry.ip, info.hardwareAddress);
        entry.vendor = info.vendor;
        if (info.hostname) {
            entry.hostname = HostnameResolverChain::sanitize(entry.ip, *info.hostname);
        }
        entries.push_back(std::move(entry));
    }

    if (!entries.empty()) {
        infra::AsioContext pool(std::min(options_.workers, entries.size()), "port-scan");
        pool.start();

        std::vector<std::future<void>> pending;
        pending.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            pending.push_back(pool.submit([this, &entries, &stopRequested, i]() {
                if (stopRequested.load()) {
                    return;
                }
                scanOne(entries[i]);
            }));
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            } catch (const std::exception& e) {
                spdlog::warn("Scan unit for {} failed: {}", entries[i].ip, e.what());
            }
        }
        pool.stop();

        if (stopRequested.load()) {
            spdlog::warn("Stop requested during port scan, results are partial");
        }
    }

    for (auto& entry : entries) {
        if (entry.hostname.empty()) {
            entry.hostname = IdentityResolver::fallbackHostname(entry.ip);
        }
    }
    return entries;
}

void ScanOrchestrator::scanOne(SnapshotEntry& entry) {
    if (entry.hostname.empty() && names_) {
        entry.hostname = names_->resolve(entry.ip);
    }

    if (!scanner_) {
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + options_.hostTimeout;
    try {
        auto outcome = scanner_->scanPorts(entry.ip, options_.request, deadline);
        if (outcome.timedOut) {
            spdlog::warn("Port scan of {} exceeded {} s, recording no ports", entry.ip,
                         options_.hostTimeout.count());
            entry.portScanTimedOut = true;
            entry.ports.clear();
            return;
        }
        entry.ports = std::move(outcome.openPorts);
        spdlog::debug("{}: {} open ports via {}", entry.ip, entry.ports.size(), outcome.method);
    } catch (const std::exception& e) {
        spdlog::warn("Port scan of {} failed: {}", entry.ip, e.what());
        entry.ports.clear();
    }
}

} // namespace netledger::engine
