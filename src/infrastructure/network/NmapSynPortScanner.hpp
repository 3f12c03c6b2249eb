#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IPortScanner.hpp"

namespace netledger::infra {

/**
 * @brief Half-open SYN scanner backed by `nmap -sS`.
 *
 * Faster and quieter than full connects but needs raw-socket privilege.
 */
class NmapSynPortScanner : public core::IPortScanner {
public:
    explicit NmapSynPortScanner(core::ICommandRunner& runner);

    /**
     * @throws core::PrivilegeError when nmap refuses to run a SYN scan.
     * @throws core::ToolUnavailableError when nmap is missing or fails to start.
     */
    core::PortScanOutcome scanPorts(const std::string& ip, const core::PortScanRequest& request,
                                    Deadline deadline) override;

    [[nodiscard]] std::string name() const override { return "syn"; }

    /**
     * @brief Extracts open TCP ports from nmap grepable (-oG) output.
     */
    static std::vector<uint16_t> parseGrepableOutput(const std::string& output);

    /**
     * @brief Checks nmap output for a root-privilege refusal.
     */
    static bool isPrivilegeRefusal(const std::string& output);

private:
    core::ICommandRunner& runner_;
};

} // namespace netledger::infra
