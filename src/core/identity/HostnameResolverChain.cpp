#include "core/identity/HostnameResolverChain.hpp"

#include "core/identity/IdentityResolver.hpp"
#include "core/types/HostRecord.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace netledger::core {

HostnameResolverChain::HostnameResolverChain(std::chrono::milliseconds perMethodTimeout)
    : timeout_(perMethodTimeout) {}

void HostnameResolverChain::addResolver(std::unique_ptr<IHostnameResolver> resolver) {
    if (resolver) {
        resolvers_.push_back(std::move(resolver));
    }
}

std::string HostnameResolverChain::resolve(const std::string& ip) const {
    for (const auto& resolver : resolvers_) {
        try {
            auto result = resolver->resolve(ip, timeout_);
            if (!result) {
                continue;
            }
            auto name = sanitize(ip, *result);
            if (!name.empty()) {
                spdlog::debug("Resolved {} to '{}' via {}", ip, name, resolver->name());
                return name;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Hostname lookup via {} failed for {}: {}", resolver->name(), ip,
                          e.what());
        }
    }
    return IdentityResolver::fallbackHostname(ip);
}

std::string HostnameResolverChain::sanitize(const std::string& ip, const std::string& candidate) {
    // ';' separates hostnames in the ledger
    std::string cleaned = candidate;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ';'), cleaned.end());

    const char* whitespace = " \t\r\n";
    auto first = cleaned.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    auto last = cleaned.find_last_not_of(whitespace);
    std::string name = cleaned.substr(first, last - first + 1);

    if (name.size() > 1 && name.back() == '.') {
        name.pop_back();
    }
    if (name == ip || name == kSentinelIdentity) {
        return {};
    }
    return name;
}

} // namespace netledger::core
