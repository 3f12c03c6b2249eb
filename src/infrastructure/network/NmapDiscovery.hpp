#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IDiscoverySource.hpp"

#include <chrono>
#include <string>

namespace netledger::infra {

/**
 * @brief Fallback discovery through an nmap ping scan (`nmap -sn`).
 *
 * Reports the MAC address and vendor only when nmap runs privileged on the
 * local segment; otherwise hosts come back with a hostname at most.
 */
class NmapDiscovery : public core::IDiscoverySource {
public:
    explicit NmapDiscovery(core::ICommandRunner& runner,
                           std::chrono::seconds toolTimeout = std::chrono::seconds(120));

    core::DiscoveryOutcome discover(const core::Subnet& subnet,
                                    const core::DiscoveryContext& context) override;

    [[nodiscard]] std::string name() const override { return "nmap"; }

    /**
     * @brief Parses nmap's normal output for "Nmap scan report for" blocks.
     */
    static core::DiscoveryMap parseOutput(const std::string& output);

private:
    core::ICommandRunner& runner_;
    std::chrono::seconds toolTimeout_;
};

} // namespace netledger::infra
