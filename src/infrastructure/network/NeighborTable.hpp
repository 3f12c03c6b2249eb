#pragma once

#include "core/types/Ipv4.hpp"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace netledger::infra {

/**
 * @brief Read access to the kernel IPv4 neighbor (ARP) cache.
 *
 * Used to attach hardware addresses to hosts that only answered ICMP.
 */
class NeighborTable {
public:
    explicit NeighborTable(std::string path = "/proc/net/arp");

    /**
     * @brief Re-reads the table from disk.
     * @return Number of complete entries loaded.
     */
    size_t refresh();

    /**
     * @brief Hardware address for an IP, from the last refresh().
     */
    std::optional<std::string> lookup(core::Ipv4Address ip) const;

    /**
     * @brief Parses /proc/net/arp content.
     *
     * Incomplete entries (flags 0x0) and all-zero addresses are skipped.
     */
    static std::map<core::Ipv4Address, std::string> parse(std::istream& input);

private:
    std::string path_;
    std::map<core::Ipv4Address, std::string> entries_;
    mutable std::mutex mutex_;
};

} // namespace netledger::infra
