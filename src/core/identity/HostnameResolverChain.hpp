/**
 * @file HostnameResolverChain.hpp
 * @brief Ordered fallback chain of hostname lookup strategies.
 */

#pragma once

#include "core/services/IHostnameResolver.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief Tries each resolver in order and returns the first usable name.
 *
 * A name is usable when it is non-empty after trimming and is not the queried
 * address echoed back. When every resolver comes up empty the deterministic
 * fallback name is returned, so resolve() never yields an empty string.
 */
class HostnameResolverChain {
public:
    explicit HostnameResolverChain(std::chrono::milliseconds perMethodTimeout =
                                       std::chrono::seconds(2));

    /**
     * @brief Appends a strategy to the end of the chain.
     */
    void addResolver(std::unique_ptr<IHostnameResolver> resolver);

    /**
     * @brief Resolves a hostname for an address.
     */
    std::string resolve(const std::string& ip) const;

    /**
     * @brief Cleans up a raw lookup result.
     *
     * Drops ';', then trims whitespace and a trailing root dot.
     * @return The cleaned name, or empty if the result is not usable for ip.
     */
    static std::string sanitize(const std::string& ip, const std::string& candidate);

    [[nodiscard]] size_t size() const { return resolvers_.size(); }

private:
    std::vector<std::unique_ptr<IHostnameResolver>> resolvers_;
    std::chrono::milliseconds timeout_;
};

} // namespace netledger::core
