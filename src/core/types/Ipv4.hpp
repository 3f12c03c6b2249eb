/**
 * @file Ipv4.hpp
 * @brief IPv4 address, subnet and range value types.
 *
 * This file defines the small value types used throughout discovery and
 * reconciliation to validate, order and enumerate IPv4 addresses.
 */

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netledger::core {

/**
 * @brief An IPv4 address stored in host byte order.
 */
struct Ipv4Address {
    uint32_t value{0}; ///< Address as a 32-bit integer (first octet in the high byte)

    /**
     * @brief Parses a dotted-quad string such as "192.168.1.10".
     * @param text The text to parse. Surrounding whitespace is not accepted.
     * @return The address, or nullopt if the text is not a valid IPv4 address.
     */
    static std::optional<Ipv4Address> parse(std::string_view text);

    /**
     * @brief Builds an address from its four octets.
     */
    static Ipv4Address fromOctets(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

    /**
     * @brief Returns the four octets, most significant first.
     */
    [[nodiscard]] std::array<uint8_t, 4> octets() const;

    /**
     * @brief Formats the address in dotted-quad notation.
     */
    [[nodiscard]] std::string toString() const;

    auto operator<=>(const Ipv4Address& other) const = default;
};

/**
 * @brief An IPv4 network in CIDR form.
 */
struct Subnet {
    Ipv4Address network;  ///< Network address (host bits cleared)
    int prefixLength{24}; ///< Prefix length, 0-32

    /**
     * @brief Parses CIDR notation ("10.0.0.0/24"). A bare address is a /32.
     * @return The subnet with host bits cleared, or nullopt on malformed input.
     */
    static std::optional<Subnet> parse(std::string_view cidr);

    /**
     * @brief Builds the subnet containing an address for the given prefix.
     */
    static Subnet fromAddress(Ipv4Address address, int prefixLength);

    /**
     * @brief Computes the prefix length from a dotted netmask.
     * @return Prefix length, or nullopt if the mask is not contiguous.
     */
    static std::optional<int> prefixFromNetmask(Ipv4Address netmask);

    [[nodiscard]] Ipv4Address netmask() const;
    [[nodiscard]] Ipv4Address broadcast() const;
    [[nodiscard]] bool contains(Ipv4Address address) const;

    /**
     * @brief Number of usable host addresses in the subnet.
     *
     * /31 and /32 networks count every address as a host.
     */
    [[nodiscard]] uint64_t hostCount() const;

    /**
     * @brief Enumerates usable host addresses in ascending order.
     */
    [[nodiscard]] std::vector<Ipv4Address> hosts() const;

    /**
     * @brief Formats the subnet as "a.b.c.d/n".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Subnet& other) const = default;
};

/**
 * @brief An inclusive range of IPv4 addresses.
 *
 * Used for the configured "known-empty" ranges that the ping sweep skips.
 */
struct Ipv4Range {
    Ipv4Address first;
    Ipv4Address last;

    /**
     * @brief Parses "a.b.c.d-e.f.g.h", "a.b.c.d-N" (last octet) or CIDR.
     * @return The range, or nullopt if malformed or inverted.
     */
    static std::optional<Ipv4Range> parse(std::string_view text);

    [[nodiscard]] bool contains(Ipv4Address address) const {
        return address >= first && address <= last;
    }

    bool operator==(const Ipv4Range& other) const = default;
};

/**
 * @brief Sort key ordering IPv4 strings numerically per octet.
 *
 * Strings that are not valid IPv4 addresses map to 0 so that they sort
 * before every valid address.
 */
uint64_t ipSortKey(std::string_view ip);

} // namespace netledger::core
