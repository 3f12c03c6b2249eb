/**
 * @file IPortScanner.hpp
 * @brief Interface for per-host TCP port scanning strategies.
 *
 * This file defines the abstract interface shared by the connect scanner,
 * the SYN scanner and the fallback chain that combines them.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <string>

namespace netledger::core {

/**
 * @brief Interface for scanning the open TCP ports of one host.
 *
 * Implementations are stateless between calls and may be invoked from
 * several worker threads at once.
 */
class IPortScanner {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    virtual ~IPortScanner() = default;

    /**
     * @brief Scans the requested ports on one host.
     * @param ip Target IPv4 address.
     * @param request Ports to probe and per-probe limits.
     * @param deadline Time after which the scan is abandoned and reported timed out.
     * @return Open ports in ascending order.
     * @throws PrivilegeError if the scanner needs privileges the process lacks.
     * @throws ToolUnavailableError if a required external tool is missing.
     */
    virtual PortScanOutcome scanPorts(const std::string& ip, const PortScanRequest& request,
                                      Deadline deadline) = 0;

    /**
     * @brief Short name used in logs and scan outcomes ("connect", "syn").
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace netledger::core
