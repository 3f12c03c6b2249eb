#pragma once

#include "core/services/IDiscoverySource.hpp"
#include "core/services/IPingService.hpp"
#include "infrastructure/network/NeighborTable.hpp"

#include <chrono>
#include <vector>

namespace netledger::infra {

/**
 * @brief Supplementary discovery: ICMP echo to every host address.
 *
 * Catches hosts that ignore ARP sweeps or sit behind the fallback source's
 * blind spots. Addresses already found by an earlier source and configured
 * known-empty ranges are skipped. Responders get their hardware address from
 * the neighbor table, which the echo exchange has just populated.
 */
class PingSweepDiscovery : public core::IDiscoverySource {
public:
    struct Options {
        size_t workers{4};
        std::chrono::milliseconds timeout{1000};
        std::vector<core::Ipv4Range> knownEmptyRanges;
        uint64_t maxHosts{4096}; ///< Larger subnets are not swept
    };

    PingSweepDiscovery(core::IPingService& pinger, NeighborTable& neighbors, Options options);

    core::DiscoveryOutcome discover(const core::Subnet& subnet,
                                    const core::DiscoveryContext& context) override;

    [[nodiscard]] std::string name() const override { return "ping-sweep"; }

    /**
     * @brief Addresses the sweep would probe for a subnet and context.
     */
    std::vector<core::Ipv4Address> targets(const core::Subnet& subnet,
                                           const core::DiscoveryContext& context) const;

private:
    bool inKnownEmptyRange(core::Ipv4Address ip) const;

    core::IPingService& pinger_;
    NeighborTable& neighbors_;
    Options options_;
};

} // namespace netledger::infra
