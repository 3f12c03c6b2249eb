/**
 * @file IHostnameResolver.hpp
 * @brief Interface for one hostname lookup strategy.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netledger::core {

/**
 * @brief One step of the hostname resolution chain.
 */
class IHostnameResolver {
public:
    virtual ~IHostnameResolver() = default;

    /**
     * @brief Looks up a name for an IPv4 address.
     * @param ip Address to resolve.
     * @param timeout Upper bound for this lookup.
     * @return The name, or nullopt when nothing was found in time.
     */
    virtual std::optional<std::string> resolve(const std::string& ip,
                                               std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace netledger::core
