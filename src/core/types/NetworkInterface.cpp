#include "core/types/NetworkInterface.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace netledger::core {

namespace {

const NetworkInterface* findUsable(const std::vector<NetworkInterface>& interfaces,
                                   const std::string& name) {
    for (const auto& iface : interfaces) {
        if (iface.name == name && iface.isUp && !iface.isLoopback && iface.subnet()) {
            return &iface;
        }
    }
    return nullptr;
}

#ifdef __linux__
std::string toDotted(const struct sockaddr* addr) {
    if (addr == nullptr || addr->sa_family != AF_INET) {
        return {};
    }
    char buffer[INET_ADDRSTRLEN];
    const auto* in = reinterpret_cast<const struct sockaddr_in*>(addr);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, INET_ADDRSTRLEN) == nullptr) {
        return {};
    }
    return buffer;
}
#endif

} // namespace

std::optional<Subnet> NetworkInterface::subnet() const {
    auto address = Ipv4Address::parse(ipAddress);
    auto mask = Ipv4Address::parse(netmask);
    if (!address || !mask) {
        return std::nullopt;
    }
    auto prefix = Subnet::prefixFromNetmask(*mask);
    if (!prefix) {
        return std::nullopt;
    }
    return Subnet::fromAddress(*address, *prefix);
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.ipAddress = toDotted(ifa->ifa_addr);
        iface.netmask = toDotted(ifa->ifa_netmask);
        iface.macAddress = readHardwareAddress(iface.name);
        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<std::string> NetworkInterfaceEnumerator::defaultRouteInterface(
    const std::string& routeTablePath) {
    std::ifstream file(routeTablePath);
    if (!file) {
        return std::nullopt;
    }
    return parseDefaultRoute(file);
}

std::optional<std::string> NetworkInterfaceEnumerator::parseDefaultRoute(std::istream& routeTable) {
    std::string line;
    // Header: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
    if (!std::getline(routeTable, line)) {
        return std::nullopt;
    }

    std::optional<std::string> best;
    long bestMetric = 0;
    while (std::getline(routeTable, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flags, refCnt, use, metric, mask;
        if (!(fields >> iface >> destination >> gateway >> flags >> refCnt >> use >> metric >>
              mask)) {
            continue;
        }
        if (destination != "00000000" || mask != "00000000") {
            continue;
        }
        long metricValue = std::strtol(metric.c_str(), nullptr, 10);
        if (!best || metricValue < bestMetric) {
            best = iface;
            bestMetric = metricValue;
        }
    }
    return best;
}

std::string NetworkInterfaceEnumerator::readHardwareAddress(const std::string& interfaceName) {
    std::ifstream file("/sys/class/net/" + interfaceName + "/address");
    std::string address;
    if (file) {
        file >> address;
    }
    return address;
}

SubnetSelection selectScanSubnet(const std::string& overrideCidr,
                                 const std::string& configuredInterface,
                                 const std::vector<NetworkInterface>& interfaces,
                                 const std::optional<std::string>& defaultRouteInterface) {
    if (!overrideCidr.empty()) {
        if (auto subnet = Subnet::parse(overrideCidr)) {
            return {*subnet, "override", ""};
        }
    }

    if (!configuredInterface.empty()) {
        if (const auto* iface = findUsable(interfaces, configuredInterface)) {
            return {*iface->subnet(), "interface", iface->name};
        }
    }

    if (defaultRouteInterface) {
        if (const auto* iface = findUsable(interfaces, *defaultRouteInterface)) {
            return {*iface->subnet(), "default-route", iface->name};
        }
    }

    for (const auto& iface : interfaces) {
        if (iface.isUp && !iface.isLoopback && iface.subnet()) {
            return {*iface.subnet(), "first-up", iface.name};
        }
    }

    return {Subnet::fromAddress(Ipv4Address::fromOctets(192, 168, 1, 0), 24), "fallback", ""};
}

} // namespace netledger::core
