#include "core/types/Ipv4.hpp"

#include <algorithm>
#include <charconv>

namespace netledger::core {

namespace {

std::optional<uint32_t> parseNumber(std::string_view text, uint32_t max) {
    if (text.empty() || text.size() > 3) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > max) {
        return std::nullopt;
    }
    return value;
}

uint32_t maskForPrefix(int prefixLength) {
    if (prefixLength <= 0) {
        return 0;
    }
    if (prefixLength >= 32) {
        return 0xFFFFFFFFu;
    }
    return 0xFFFFFFFFu << (32 - prefixLength);
}

} // namespace

std::optional<Ipv4Address> Ipv4Address::parse(std::string_view text) {
    uint32_t result = 0;

    for (int part = 0; part < 4; ++part) {
        auto dot = text.find('.');
        bool last = part == 3;
        if (last != (dot == std::string_view::npos)) {
            return std::nullopt;
        }

        auto octet = parseNumber(text.substr(0, dot), 255);
        if (!octet) {
            return std::nullopt;
        }
        result = (result << 8) | *octet;

        if (!last) {
            text.remove_prefix(dot + 1);
        }
    }
    return Ipv4Address{result};
}

Ipv4Address Ipv4Address::fromOctets(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    return Ipv4Address{(static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
                       (static_cast<uint32_t>(c) << 8) | static_cast<uint32_t>(d)};
}

std::array<uint8_t, 4> Ipv4Address::octets() const {
    return {static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
            static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
}

std::string Ipv4Address::toString() const {
    auto o = octets();
    return std::to_string(o[0]) + "." + std::to_string(o[1]) + "." + std::to_string(o[2]) + "." +
           std::to_string(o[3]);
}

std::optional<Subnet> Subnet::parse(std::string_view cidr) {
    auto slash = cidr.find('/');
    auto address = Ipv4Address::parse(cidr.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    int prefix = 32;
    if (slash != std::string_view::npos) {
        auto parsed = parseNumber(cidr.substr(slash + 1), 32);
        if (!parsed) {
            return std::nullopt;
        }
        prefix = static_cast<int>(*parsed);
    }
    return fromAddress(*address, prefix);
}

Subnet Subnet::fromAddress(Ipv4Address address, int prefixLength) {
    Subnet subnet;
    subnet.prefixLength = std::clamp(prefixLength, 0, 32);
    subnet.network = Ipv4Address{address.value & maskForPrefix(subnet.prefixLength)};
    return subnet;
}

std::optional<int> Subnet::prefixFromNetmask(Ipv4Address netmask) {
    uint32_t mask = netmask.value;
    int prefix = 0;
    while (prefix < 32 && (mask & 0x80000000u)) {
        mask <<= 1;
        ++prefix;
    }
    // Any remaining set bit means the mask had a hole in it
    if (mask != 0) {
        return std::nullopt;
    }
    return prefix;
}

Ipv4Address Subnet::netmask() const {
    return Ipv4Address{maskForPrefix(prefixLength)};
}

Ipv4Address Subnet::broadcast() const {
    return Ipv4Address{network.value | ~maskForPrefix(prefixLength)};
}

bool Subnet::contains(Ipv4Address address) const {
    return (address.value & maskForPrefix(prefixLength)) == network.value;
}

uint64_t Subnet::hostCount() const {
    uint64_t total = uint64_t{1} << (32 - prefixLength);
    return prefixLength >= 31 ? total : total - 2;
}

std::vector<Ipv4Address> Subnet::hosts() const {
    std::vector<Ipv4Address> result;
    uint64_t first = network.value;
    uint64_t last = broadcast().value;
    if (prefixLength < 31) {
        ++first;
        --last;
    }

    result.reserve(static_cast<size_t>(last - first + 1));
    for (uint64_t v = first; v <= last; ++v) {
        result.push_back(Ipv4Address{static_cast<uint32_t>(v)});
    }
    return result;
}

std::string Subnet::toString() const {
    return network.toString() + "/" + std::to_string(prefixLength);
}

std::optional<Ipv4Range> Ipv4Range::parse(std::string_view text) {
    if (text.find('/') != std::string_view::npos) {
        auto subnet = Subnet::parse(text);
        if (!subnet) {
            return std::nullopt;
        }
        return Ipv4Range{subnet->network, subnet->broadcast()};
    }

    auto dash = text.find('-');
    auto first = Ipv4Address::parse(text.substr(0, dash));
    if (!first) {
        return std::nullopt;
    }
    if (dash == std::string_view::npos) {
        return Ipv4Range{*first, *first};
    }

    auto rest = text.substr(dash + 1);
    std::optional<Ipv4Address> last = Ipv4Address::parse(rest);
    if (!last) {
        // Short form: "192.168.1.100-150" replaces only the final octet
        auto octet = parseNumber(rest, 255);
        if (!octet) {
            return std::nullopt;
        }
        last = Ipv4Address{(first->value & 0xFFFFFF00u) | *octet};
    }

    if (*last < *first) {
        return std::nullopt;
    }
    return Ipv4Range{*first, *last};
}

uint64_t ipSortKey(std::string_view ip) {
    auto address = Ipv4Address::parse(ip);
    if (!address) {
        return 0;
    }
    return (uint64_t{1} << 32) | address->value;
}

} // namespace netledger::core
