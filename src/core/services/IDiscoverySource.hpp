/**
 * @file IDiscoverySource.hpp
 * @brief Interface for host discovery mechanisms.
 */

#pragma once

#include "core/types/Discovery.hpp"
#include "core/types/Ipv4.hpp"

#include <atomic>
#include <string>

namespace netledger::core {

/**
 * @brief What a discovery source may know about the rest of the run.
 */
struct DiscoveryContext {
    const DiscoveryMap* alreadyFound{nullptr};        ///< Hosts found by earlier sources, may be null
    const std::atomic<bool>* stopRequested{nullptr};  ///< Cooperative stop flag, may be null

    [[nodiscard]] bool stopping() const {
        return stopRequested != nullptr && stopRequested->load();
    }

    [[nodiscard]] bool isKnown(Ipv4Address ip) const {
        return alreadyFound != nullptr && alreadyFound->count(ip) > 0;
    }
};

/**
 * @brief A mechanism that finds responding hosts on a subnet.
 *
 * Sources never throw for tool or transport problems; they report them in the
 * outcome status and return whatever they found.
 */
class IDiscoverySource {
public:
    virtual ~IDiscoverySource() = default;

    virtual DiscoveryOutcome discover(const Subnet& subnet, const DiscoveryContext& context) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace netledger::core
