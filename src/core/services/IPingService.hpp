/**
 * @file IPingService.hpp
 * @brief Interface for single-shot ICMP reachability probes.
 *
 * This file defines the abstract interface the ping sweep uses to probe one
 * address at a time, so that tests can substitute a deterministic prober.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <string>

namespace netledger::core {

/**
 * @brief Interface for ICMP echo probes.
 *
 * @note Raw ICMP requires CAP_NET_RAW or root. Implementations fall back to
 *       the system ping utility when the raw socket cannot be opened.
 */
class IPingService {
public:
    virtual ~IPingService() = default;

    /**
     * @brief Sends one echo request and waits for the reply or the timeout.
     * @param address IPv4 address to probe.
     * @param timeout Maximum time to wait for a reply.
     * @return Probe result; success is false on timeout or error.
     */
    virtual PingResult ping(const std::string& address, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Checks whether any probe mechanism can run on this machine.
     */
    virtual bool available() = 0;
};

} // namespace netledger::core
