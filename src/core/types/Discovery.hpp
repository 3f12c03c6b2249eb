/**
 * @file Discovery.hpp
 * @brief Result types produced by host discovery sources.
 */

#pragma once

#include "core/types/Ipv4.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace netledger::core {

/**
 * @brief What a discovery source learned about one responding address.
 */
struct DiscoveryInfo {
    std::optional<std::string> hardwareAddress; ///< MAC as reported by the source (not normalized)
    std::optional<std::string> vendor;          ///< NIC vendor, when the source knows it
    std::optional<std::string> hostname;        ///< Name reported by the source, if any
    std::string source;                         ///< Name of the source that found the host

    bool operator==(const DiscoveryInfo& other) const = default;
};

/**
 * @brief Discovered hosts keyed by address, in ascending numeric order.
 */
using DiscoveryMap = std::map<Ipv4Address, DiscoveryInfo>;

/**
 * @brief Overall result of running one discovery source.
 */
enum class DiscoveryStatus {
    Ok,          ///< The source ran; hosts may still be empty
    Unavailable, ///< The mechanism cannot run here (tool missing)
    Failed       ///< The source ran and broke; hosts holds any partial result
};

/**
 * @brief Hosts found by a discovery source together with its status.
 */
struct DiscoveryOutcome {
    DiscoveryStatus status{DiscoveryStatus::Ok};
    DiscoveryMap hosts;
    std::string message; ///< Human-readable reason for Unavailable/Failed

    static DiscoveryOutcome unavailable(std::string reason) {
        return {DiscoveryStatus::Unavailable, {}, std::move(reason)};
    }

    static DiscoveryOutcome failed(std::string reason, DiscoveryMap partial = {}) {
        return {DiscoveryStatus::Failed, std::move(partial), std::move(reason)};
    }

    [[nodiscard]] bool ok() const { return status == DiscoveryStatus::Ok; }
};

/**
 * @brief Converts a DiscoveryStatus to a short string for logging.
 */
inline const char* discoveryStatusToString(DiscoveryStatus status) {
    switch (status) {
    case DiscoveryStatus::Ok:
        return "ok";
    case DiscoveryStatus::Unavailable:
        return "unavailable";
    case DiscoveryStatus::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace netledger::core
