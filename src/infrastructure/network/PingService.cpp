#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <random>
#include <regex>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace netledger::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;

#ifdef __linux__
// Closes the descriptor on every exit path
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};
#endif

} // namespace

PingService::PingService(core::ICommandRunner& runner) : runner_(runner) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService initialized with identifier: {}", identifier_);
}

bool PingService::hasRawSocketPrivilege() {
#ifdef __linux__
    SocketHandle sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    return sock.valid();
#else
    return false;
#endif
}

bool PingService::useRawSockets() {
    std::call_once(modeOnce_, [this]() {
        rawSockets_ = hasRawSocketPrivilege();
        if (rawSockets_) {
            spdlog::debug("Ping sweep using raw ICMP sockets");
        } else {
            spdlog::info("No CAP_NET_RAW, ping sweep falls back to the ping utility");
        }
    });
    return rawSockets_;
}

uint16_t PingService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

bool PingService::available() {
    return useRawSockets() || runner_.isAvailable("ping");
}

core::PingResult PingService::ping(const std::string& address, std::chrono::milliseconds timeout) {
    return useRawSockets() ? performRawPing(address, timeout)
                           : performUtilityPing(address, timeout);
}

core::PingResult PingService::performRawPing(const std::string& address,
                                             std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.address = address;
    result.method = "raw";

#ifdef __linux__
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        result.errorMessage = "Invalid IPv4 address";
        return result;
    }

    SocketHandle sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    if (!sock.valid()) {
        result.errorMessage = "Failed to create raw socket (need CAP_NET_RAW)";
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        result.errorMessage = "Failed to send ICMP packet";
        return result;
    }

    // A raw socket sees every ICMP packet on the host, so keep reading until
    // our own reply arrives or the deadline passes.
    std::array<uint8_t, 1024> recvBuffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready <= 0) {
            result.errorMessage = ready == 0 ? "Timeout" : "Poll error";
            return result;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 28 || from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        const auto* ipHeader = recvBuffer.data();
        size_t ipHeaderLen = static_cast<size_t>((ipHeader[0] & 0x0F) * 4);
        if (static_cast<size_t>(received) < ipHeaderLen + 8) {
            continue;
        }
        const auto* icmpHeader = recvBuffer.data() + ipHeaderLen;
        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];
        if (recvId != identifier_ || recvSeq != seq) {
            continue;
        }

        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        result.ttl = ipHeader[8];
        spdlog::trace("Ping to {} successful: {} us TTL={}", address, result.latency.count(),
                      *result.ttl);
        return result;
    }
#else
    result.errorMessage = "ICMP ping not implemented for this platform";
    return result;
#endif
}

core::PingResult PingService::performUtilityPing(const std::string& address,
                                                 std::chrono::milliseconds timeout) {
    auto waitSeconds = std::max<long long>((timeout.count() + 999) / 1000, 1);
    auto command = runner_.run({"ping", "-c", "1", "-n", "-W", std::to_string(waitSeconds), address},
                               std::chrono::seconds(waitSeconds + 2));
    return parsePingUtilityOutput(address, command);
}

core::PingResult PingService::parsePingUtilityOutput(const std::string& address,
                                                     const core::CommandResult& command) {
    core::PingResult result;
    result.address = address;
    result.method = "ping-utility";

    switch (command.status) {
    case core::CommandStatus::NotFound:
        result.errorMessage = "ping utility not installed";
        return result;
    case core::CommandStatus::TimedOut:
        result.errorMessage = "Timeout";
        return result;
    case core::CommandStatus::LaunchFailed:
        result.errorMessage = "Failed to start ping utility";
        return result;
    case core::CommandStatus::Completed:
        break;
    }

    if (command.exitCode != 0) {
        result.errorMessage = "No reply";
        return result;
    }

    static const std::regex ttlPattern(R"(ttl=(\d+))", std::regex::icase);
    static const std::regex timePattern(R"(time[=<]([0-9.]+)\s*ms)");

    std::smatch match;
    if (std::regex_search(command.output, match, ttlPattern)) {
        result.ttl = std::stoi(match[1].str());
    }
    if (std::regex_search(command.output, match, timePattern)) {
        result.latency = std::chrono::microseconds(
            static_cast<int64_t>(std::stod(match[1].str()) * 1000.0));
    }
    result.success = true;
    return result;
}

} // namespace netledger::infra
