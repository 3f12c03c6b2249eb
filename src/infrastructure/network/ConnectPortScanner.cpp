#include "infrastructure/network/ConnectPortScanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace netledger::infra {

core::PortScanOutcome ConnectPortScanner::scanPorts(const std::string& ip,
                                                    const core::PortScanRequest& request,
                                                    Deadline deadline) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(ip, ec);
    if (ec) {
        throw std::invalid_argument("Invalid IPv4 address: '" + ip + "'");
    }

    auto scan = std::make_shared<ScanState>();
    scan->ports = request.portsToScan();
    scan->maxInFlight = static_cast<size_t>(std::max(request.maxConcurrentProbes, 1));
    scan->probeTimeout = request.probeTimeout;
    scan->address = address;

    spdlog::debug("Connect scan of {} on {} ports", ip, scan->ports.size());

    asio::io_context io;
    launchProbes(io, scan);
    io.run_until(deadline);

    core::PortScanOutcome outcome;
    outcome.method = name();
    outcome.timedOut = scan->next < scan->ports.size() || scan->inFlight > 0;
    outcome.openPorts = scan->openPorts;
    std::sort(outcome.openPorts.begin(), outcome.openPorts.end());

    if (outcome.timedOut) {
        spdlog::warn("Connect scan of {} hit its deadline after {} of {} ports", ip,
                     scan->next - scan->inFlight, scan->ports.size());
        // Pending handlers are destroyed with the io_context
        io.stop();
    } else {
        spdlog::debug("Connect scan of {} complete: {} open ports", ip, outcome.openPorts.size());
    }
    return outcome;
}

void ConnectPortScanner::launchProbes(asio::io_context& io, const std::shared_ptr<ScanState>& scan) {
    while (scan->inFlight < scan->maxInFlight && scan->next < scan->ports.size()) {
        uint16_t port = scan->ports[scan->next++];
        ++scan->inFlight;
        startProbe(io, scan, port);
    }
}

void ConnectPortScanner::startProbe(asio::io_context& io, const std::shared_ptr<ScanState>& scan,
                                    uint16_t port) {
    auto probe = std::make_shared<ProbeState>();
    probe->socket = std::make_unique<asio::ip::tcp::socket>(io);
    probe->timer = std::make_unique<asio::steady_timer>(io);
    probe->port = port;

    asio::ip::tcp::endpoint endpoint(scan->address, port);

    probe->timer->expires_after(scan->probeTimeout);
    probe->timer->async_wait([&io, scan, probe](const asio::error_code& ec) {
        if (ec || probe->completed) {
            return; // Timer cancelled or connect already finished
        }
        // Filtered: no answer before the probe timeout
        finishProbe(io, scan, probe, false);
    });

    probe->socket->async_connect(endpoint, [&io, scan, probe](const asio::error_code& ec) {
        if (probe->completed) {
            return; // Already timed out
        }
        finishProbe(io, scan, probe, !ec);
    });
}

void ConnectPortScanner::finishProbe(asio::io_context& io, const std::shared_ptr<ScanState>& scan,
                                     const std::shared_ptr<ProbeState>& probe, bool open) {
    probe->completed = true;
    probe->timer->cancel();

    asio::error_code ignored;
    probe->socket->close(ignored);

    if (open) {
        scan->openPorts.push_back(probe->port);
    }
    --scan->inFlight;
    launchProbes(io, scan);
}

} // namespace netledger::infra
