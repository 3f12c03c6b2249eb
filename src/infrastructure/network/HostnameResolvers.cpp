#include "infrastructure/network/HostnameResolvers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <memory>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace netledger::infra {

namespace {

std::chrono::seconds toolBudget(std::chrono::milliseconds timeout) {
    return std::chrono::seconds(std::max<long long>((timeout.count() + 999) / 1000, 1));
}

std::optional<std::string> lookupPtr(const std::string& ip) {
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), host,
                         sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        return std::nullopt;
    }
    return std::string(host);
}

} // namespace

std::optional<std::string> ReverseDnsResolver::resolve(const std::string& ip,
                                                       std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto future = promise->get_future();

    std::thread([promise, ip]() {
        try {
            promise->set_value(lookupPtr(ip));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::debug("Reverse DNS for {} timed out", ip);
        return std::nullopt;
    }
    return future.get();
}

GetentResolver::GetentResolver(core::ICommandRunner& runner) : runner_(runner) {}

std::optional<std::string> GetentResolver::resolve(const std::string& ip,
                                                   std::chrono::milliseconds timeout) {
    auto result = runner_.run({"getent", "hosts", ip}, toolBudget(timeout));
    if (!result.succeeded()) {
        return std::nullopt;
    }
    return parseOutput(result.output);
}

std::optional<std::string> GetentResolver::parseOutput(const std::string& output) {
    // "192.168.1.5     nas.lan nas"
    std::istringstream fields(output);
    std::string address, hostname;
    if (!(fields >> address >> hostname)) {
        return std::nullopt;
    }
    return hostname;
}

NetbiosResolver::NetbiosResolver(core::ICommandRunner& runner) : runner_(runner) {}

std::optional<std::string> NetbiosResolver::resolve(const std::string& ip,
                                                    std::chrono::milliseconds timeout) {
    auto result = runner_.run({"nmblookup", "-A", ip}, toolBudget(timeout));
    if (!result.succeeded()) {
        return std::nullopt;
    }
    return parseOutput(result.output);
}

std::optional<std::string> NetbiosResolver::parseOutput(const std::string& output) {
    // "\tMYPC            <00> -         B <ACTIVE>"
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        auto tag = line.find("<00>");
        if (tag == std::string::npos || line.find("<GROUP>") != std::string::npos) {
            continue;
        }
        std::istringstream fields(line.substr(0, tag));
        std::string name;
        if (fields >> name) {
            return name;
        }
    }
    return std::nullopt;
}

} // namespace netledger::infra
