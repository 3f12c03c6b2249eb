#include "core/identity/IdentityResolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace netledger::core {

namespace {

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::string hexOctet(uint8_t value) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02x", value);
    return buf;
}

} // namespace

std::optional<std::string> IdentityResolver::normalizeHardwareAddress(std::string_view text) {
    // "aa:bb:cc:dd:ee:ff" is 17 characters
    if (text.size() != 17) {
        return std::nullopt;
    }

    const char separator = text[2];
    if (separator != ':' && separator != '-') {
        return std::nullopt;
    }

    std::string normalized;
    normalized.reserve(17);
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (i % 3 == 2) {
            if (c != separator) {
                return std::nullopt;
            }
            normalized.push_back(':');
        } else {
            if (!isHexDigit(c)) {
                return std::nullopt;
            }
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return normalized;
}

bool IdentityResolver::isZeroHardwareAddress(std::string_view normalized) {
    return normalized == "00:00:00:00:00:00";
}

std::string IdentityResolver::pseudoIdentity(Ipv4Address ip) {
    std::string identity = "00:00";
    for (uint8_t octet : ip.octets()) {
        identity += ':';
        identity += hexOctet(octet);
    }
    return identity;
}

std::string IdentityResolver::resolve(const std::string& ip,
                                      const std::optional<std::string>& hardwareAddress) {
    auto address = Ipv4Address::parse(ip);
    if (!address) {
        throw std::invalid_argument("Invalid IPv4 address: '" + ip + "'");
    }

    if (hardwareAddress) {
        auto normalized = normalizeHardwareAddress(*hardwareAddress);
        if (normalized && !isZeroHardwareAddress(*normalized)) {
            return *normalized;
        }
    }
    return pseudoIdentity(*address);
}

std::string IdentityResolver::fallbackHostname(const std::string& ip) {
    std::string name = ip;
    std::replace(name.begin(), name.end(), '.', '-');
    return "host-" + name;
}

} // namespace netledger::core
