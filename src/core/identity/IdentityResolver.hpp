/**
 * @file IdentityResolver.hpp
 * @brief Maps discovered hosts to stable ledger identities.
 *
 * A host is keyed by its hardware address when one is known. Hosts whose
 * address is missing, all-zero or malformed get a pseudo-identity derived
 * from their IPv4 address so that they remain trackable across scans.
 */

#pragma once

#include "core/types/Ipv4.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace netledger::core {

/**
 * @brief Stateless identity and fallback-name computations.
 */
class IdentityResolver {
public:
    /**
     * @brief Normalizes a hardware address to lowercase colon-hex.
     *
     * Accepts six two-digit hex octets separated by ':' or '-'.
     * @return The normalized address, or nullopt if the text is malformed.
     */
    static std::optional<std::string> normalizeHardwareAddress(std::string_view text);

    /**
     * @brief Checks whether a normalized address is 00:00:00:00:00:00.
     */
    static bool isZeroHardwareAddress(std::string_view normalized);

    /**
     * @brief Builds the pseudo-identity "00:00:<o1>:<o2>:<o3>:<o4>".
     */
    static std::string pseudoIdentity(Ipv4Address ip);

    /**
     * @brief Resolves the identity for a discovered host.
     * @param ip Dotted-quad IPv4 address.
     * @param hardwareAddress Address reported by discovery, if any.
     * @return Normalized hardware address, or the pseudo-identity when the
     *         address is absent, all-zero or malformed.
     * @throws std::invalid_argument if ip is not a valid IPv4 address.
     */
    static std::string resolve(const std::string& ip,
                               const std::optional<std::string>& hardwareAddress);

    /**
     * @brief Deterministic hostname used when no lookup succeeds ("host-10-0-0-5").
     */
    static std::string fallbackHostname(const std::string& ip);
};

} // namespace netledger::core
