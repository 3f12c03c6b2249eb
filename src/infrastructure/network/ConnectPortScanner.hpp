#pragma once

#include "core/services/IPortScanner.hpp"

#include <asio.hpp>
#include <memory>

namespace netledger::infra {

/**
 * @brief TCP connect scanner built on Asio.
 *
 * Each scanPorts() call drives its own io_context on the calling worker
 * thread, keeping at most maxConcurrentProbes connects in flight. Every probe
 * has its own timer; only an established connection marks a port open.
 * Needs no privileges.
 */
class ConnectPortScanner : public core::IPortScanner {
public:
    core::PortScanOutcome scanPorts(const std::string& ip, const core::PortScanRequest& request,
                                    Deadline deadline) override;

    [[nodiscard]] std::string name() const override { return "connect"; }

private:
    struct ScanState {
        std::vector<uint16_t> ports;
        std::vector<uint16_t> openPorts;
        size_t next{0};
        size_t inFlight{0};
        size_t maxInFlight{1};
        std::chrono::milliseconds probeTimeout{2000};
        asio::ip::address_v4 address;
    };

    struct ProbeState {
        std::unique_ptr<asio::ip::tcp::socket> socket;
        std::unique_ptr<asio::steady_timer> timer;
        uint16_t port{0};
        bool completed{false};
    };

    static void launchProbes(asio::io_context& io, const std::shared_ptr<ScanState>& scan);
    static void startProbe(asio::io_context& io, const std::shared_ptr<ScanState>& scan,
                           uint16_t port);
    static void finishProbe(asio::io_context& io, const std::shared_ptr<ScanState>& scan,
                            const std::shared_ptr<ProbeState>& probe, bool open);
};

} // namespace netledger::infra
