#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IDiscoverySource.hpp"

#include <chrono>
#include <string>

namespace netledger::infra {

/**
 * @brief Primary discovery: a broadcast ARP sweep through arp-scan.
 *
 * ARP replies carry the hardware address, so hosts found here always get a
 * real identity. Only works on the directly attached subnet.
 */
class ArpScanDiscovery : public core::IDiscoverySource {
public:
    struct Options {
        std::string interfaceName;                 ///< Empty lets arp-scan choose
        std::chrono::seconds toolTimeout{120};
    };

    ArpScanDiscovery(core::ICommandRunner& runner, Options options);

    core::DiscoveryOutcome discover(const core::Subnet& subnet,
                                    const core::DiscoveryContext& context) override;

    [[nodiscard]] std::string name() const override { return "arp-scan"; }

    /**
     * @brief Parses arp-scan output ("ip<TAB>mac<TAB>vendor" per host).
     *
     * Banner and summary lines are ignored; for duplicate replies the first
     * one wins.
     */
    static core::DiscoveryMap parseOutput(const std::string& output);

private:
    core::ICommandRunner& runner_;
    Options options_;
};

} // namespace netledger::infra
