/**
 * @file NetworkInterface.hpp
 * @brief Local network interface enumeration and scan-subnet selection.
 *
 * This file defines the IPv4 view of a local interface, a utility class for
 * enumerating interfaces and finding the default-route interface, and the
 * rule that picks which subnet a scan cycle covers.
 */

#pragma once

#include "core/types/Ipv4.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief An IPv4-configured interface on the local system.
 */
struct NetworkInterface {
    std::string name;       ///< System name of the interface (e.g., "eth0", "wlan0")
    std::string ipAddress;  ///< IPv4 address assigned to the interface
    std::string netmask;    ///< Dotted netmask of that address
    std::string macAddress; ///< Hardware address, empty if unknown
    bool isUp{false};       ///< Whether the interface is currently up
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief The IPv4 network this interface sits on.
     * @return nullopt if the address or netmask is missing or malformed.
     */
    [[nodiscard]] std::optional<Subnet> subnet() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates every interface with an IPv4 address.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Finds the interface carrying the IPv4 default route.
     * @param routeTablePath Kernel routing table in /proc/net/route format.
     */
    static std::optional<std::string> defaultRouteInterface(
        const std::string& routeTablePath = "/proc/net/route");

    /**
     * @brief Parses /proc/net/route content and returns the default-route interface.
     */
    static std::optional<std::string> parseDefaultRoute(std::istream& routeTable);

    /**
     * @brief Reads an interface's hardware address from sysfs.
     * @return The address, or empty if unavailable.
     */
    static std::string readHardwareAddress(const std::string& interfaceName);
};

/**
 * @brief The subnet chosen for a scan cycle and where it came from.
 */
struct SubnetSelection {
    Subnet subnet;
    std::string source;        ///< "override", "interface", "default-route", "first-up" or "fallback"
    std::string interfaceName; ///< Interface the subnet belongs to, if any
};

/**
 * @brief Picks the subnet to scan.
 *
 * Order: a valid CIDR override, then the configured interface, then the
 * default-route interface, then the first up non-loopback interface, then
 * 192.168.1.0/24.
 */
SubnetSelection selectScanSubnet(const std::string& overrideCidr,
                                 const std::string& configuredInterface,
                                 const std::vector<NetworkInterface>& interfaces,
                                 const std::optional<std::string>& defaultRouteInterface);

} // namespace netledger::core
