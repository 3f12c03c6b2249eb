#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IPingService.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netledger::infra {

/**
 * @brief ICMP echo prober used by the ping sweep.
 *
 * Sends echo requests over a raw ICMP socket when the process holds
 * CAP_NET_RAW. Without that privilege every probe is delegated to the system
 * ping utility through the command runner. The choice is made once, on the
 * first probe.
 */
class PingService : public core::IPingService {
public:
    explicit PingService(core::ICommandRunner& runner);

    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief True with CAP_NET_RAW or when the ping utility is installed.
     */
    bool available() override;

    /**
     * @brief Checks whether a raw ICMP socket can be opened.
     */
    static bool hasRawSocketPrivilege();

    /**
     * @brief Parses the output of `ping -c 1` into a result.
     */
    static core::PingResult parsePingUtilityOutput(const std::string& address,
                                                   const core::CommandResult& command);

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    core::PingResult performRawPing(const std::string& address, std::chrono::milliseconds timeout);
    core::PingResult performUtilityPing(const std::string& address,
                                        std::chrono::milliseconds timeout);
    bool useRawSockets();

    core::ICommandRunner& runner_;
    std::once_flag modeOnce_;
    bool rawSockets_{false};
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace netledger::infra
