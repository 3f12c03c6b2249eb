/**
 * @file HostRecord.hpp
 * @brief Ledger entity types for the host knowledge base.
 *
 * This file defines the HostRecord stored per resolved identity, the Ledger
 * that owns all records together with the caller-defined extra columns, and
 * the HostStateView handed to downstream consumers.
 */

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace netledger::core {

/**
 * @brief Identity value marking a placeholder row that is never a real host.
 */
inline constexpr std::string_view kSentinelIdentity = "STANDALONE";

/**
 * @brief Persistent knowledge about one physical host.
 *
 * A record is keyed by its identity (normalized hardware address or an
 * IP-derived pseudo-identity). Sets are unions across scans; liveness is
 * driven by the consecutive-failure counter.
 */
struct HostRecord {
    std::string identity;              ///< Stable key (lowercase colon-hex)
    std::set<std::string> ips;         ///< Associated IPv4 addresses
    std::set<std::string> hostnames;   ///< Resolved names, never blank
    std::set<uint16_t> ports;          ///< Open TCP ports seen so far
    bool alive{false};                 ///< Derived from failedPings vs. threshold
    int failedPings{0};                ///< Consecutive scans without observation
    std::map<std::string, std::string> extra; ///< Extra ledger columns, uninterpreted

    /**
     * @brief Checks whether this row is a placeholder rather than a host.
     */
    [[nodiscard]] bool isSentinel() const { return identity == kSentinelIdentity; }

    /**
     * @brief Returns the lowest IP by numeric order, if any.
     */
    [[nodiscard]] std::optional<std::string> primaryIp() const;

    /**
     * @brief Returns the first hostname in sorted order, or empty.
     */
    [[nodiscard]] std::string primaryHostname() const;

    bool operator==(const HostRecord& other) const = default;
};

/**
 * @brief Snapshot of one host handed to external consumers after an upsert.
 *
 * Consumers hash this tuple themselves to decide whether a host needs to be
 * re-evaluated.
 */
struct HostStateView {
    std::string identity;
    std::string ip;
    std::string hostname;
    std::vector<uint16_t> ports; ///< Ascending
    bool alive{false};

    static HostStateView fromRecord(const HostRecord& record);

    bool operator==(const HostStateView& other) const = default;
};

/**
 * @brief The host knowledge base: all records plus the table schema.
 */
struct Ledger {
    /// Columns every ledger file starts with, in order.
    static constexpr std::array<std::string_view, 6> kReservedColumns = {
        "Identity", "IPs", "Hostnames", "Alive", "Ports", "FailedPings"};

    std::vector<std::string> extraColumns;          ///< Caller-defined columns, in file order
    std::map<std::string, HostRecord> records;      ///< Keyed by identity

    /**
     * @brief Returns records in persistence order.
     *
     * Ordered by the numeric value of the primary IP; records without a
     * valid IPv4 sort first. Ties are broken by identity.
     */
    [[nodiscard]] std::vector<const HostRecord*> sortedByIp() const;

    /**
     * @brief Full header row: reserved columns followed by extra columns.
     */
    [[nodiscard]] std::vector<std::string> header() const;

    /**
     * @brief Adds an extra column if it is not already present.
     *
     * Reserved column names are ignored. Existing records get an empty value.
     */
    void addExtraColumn(const std::string& name);

    [[nodiscard]] bool empty() const { return records.empty(); }
    [[nodiscard]] size_t size() const { return records.size(); }

    bool operator==(const Ledger& other) const = default;
};

/**
 * @brief Checks whether a column name is one of the six reserved columns.
 */
bool isReservedColumn(std::string_view name);

} // namespace netledger::core
