#include "infrastructure/network/PingSweepDiscovery.hpp"

#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <utility>

namespace netledger::infra {

PingSweepDiscovery::PingSweepDiscovery(core::IPingService& pinger, NeighborTable& neighbors,
                                       Options options)
    : pinger_(pinger), neighbors_(neighbors), options_(std::move(options)) {}

bool PingSweepDiscovery::inKnownEmptyRange(core::Ipv4Address ip) const {
    for (const auto& range : options_.knownEmptyRanges) {
        if (range.contains(ip)) {
            return true;
        }
    }
    return false;
}

std::vector<core::Ipv4Address> PingSweepDiscovery::targets(
    const core::Subnet& subnet, const core::DiscoveryContext& context) const {
    std::vector<core::Ipv4Address> result;
    for (auto ip : subnet.hosts()) {
        if (context.isKnown(ip) || inKnownEmptyRange(ip)) {
            continue;
        }
        result.push_back(ip);
    }
    return result;
}

core::DiscoveryOutcome PingSweepDiscovery::discover(const core::Subnet& subnet,
                                                    const core::DiscoveryContext& context) {
    if (!pinger_.available()) {
        return core::DiscoveryOutcome::unavailable("no raw ICMP privilege and no ping utility");
    }
    if (subnet.hostCount() > options_.maxHosts) {
        spdlog::warn("Skipping ping sweep of {}: {} addresses exceeds the limit of {}",
                     subnet.toString(), subnet.hostCount(), options_.maxHosts);
        return core::DiscoveryOutcome::failed("subnet too large for a ping sweep");
    }

    auto addresses = targets(subnet, context);
    spdlog::info("Ping sweep of {} addresses with {} workers", addresses.size(), options_.workers);

    // One slot per target; units write only their own slot
    std::vector<char> replied(addresses.size(), 0);
    std::vector<std::future<void>> pending;
    pending.reserve(addresses.size());

    AsioContext pool(options_.workers, "ping-sweep");
    pool.start();
    for (size_t i = 0; i < addresses.size(); ++i) {
        pending.push_back(pool.submit([this, &addresses, &replied, &context, i]() {
            if (context.stopping()) {
                return;
            }
            auto result = pinger_.ping(addresses[i].toString(), options_.timeout);
            replied[i] = result.success ? 1 : 0;
        }));
    }

    size_t failures = 0;
    for (auto& future : pending) {
        try {
            future.get();
        } catch (const std::exception& e) {
            ++failures;
            spdlog::debug("Ping unit failed: {}", e.what());
        }
    }
    pool.stop();

    neighbors_.refresh();

    core::DiscoveryMap hosts;
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (!replied[i]) {
            continue;
        }
        core::DiscoveryInfo info;
        info.source = "ping";
        info.hardwareAddress = neighbors_.lookup(addresses[i]);
        hosts.emplace(addresses[i], std::move(info));
    }

    if (context.stopping()) {
        return core::DiscoveryOutcome::failed("stop requested", std::move(hosts));
    }
    if (failures > 0) {
        spdlog::warn("Ping sweep: {} probes raised errors", failures);
    }
    spdlog::info("Ping sweep found {} additional hosts", hosts.size());
    return {core::DiscoveryStatus::Ok, std::move(hosts), {}};
}

} // namespace netledger::infra
