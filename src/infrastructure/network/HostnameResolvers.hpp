#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IHostnameResolver.hpp"

namespace netledger::infra {

/**
 * @brief Reverse DNS (PTR) lookup through getnameinfo().
 *
 * getnameinfo() has no timeout of its own, so the lookup runs on a detached
 * thread and is abandoned when the timeout expires.
 */
class ReverseDnsResolver : public core::IHostnameResolver {
public:
    std::optional<std::string> resolve(const std::string& ip,
                                       std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string name() const override { return "reverse-dns"; }
};

/**
 * @brief Lookup through the system name service switch (`getent hosts`).
 *
 * Picks up /etc/hosts entries and mDNS/LLMNR where nss is configured for them.
 */
class GetentResolver : public core::IHostnameResolver {
public:
    explicit GetentResolver(core::ICommandRunner& runner);

    std::optional<std::string> resolve(const std::string& ip,
                                       std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string name() const override { return "getent"; }

    static std::optional<std::string> parseOutput(const std::string& output);

private:
    core::ICommandRunner& runner_;
};

/**
 * @brief NetBIOS node status query (`nmblookup -A`).
 */
class NetbiosResolver : public core::IHostnameResolver {
public:
    explicit NetbiosResolver(core::ICommandRunner& runner);

    std::optional<std::string> resolve(const std::string& ip,
                                       std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string name() const override { return "netbios"; }

    /**
     * @brief Returns the first unique workstation (<00>) name in the status table.
     */
    static std::optional<std::string> parseOutput(const std::string& output);

private:
    core::ICommandRunner& runner_;
};

} // namespace netledger::infra
