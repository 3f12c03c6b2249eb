#include "infrastructure/network/FallbackPortScanner.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

namespace netledger::infra {

void FallbackPortScanner::addScanner(std::unique_ptr<core::IPortScanner> scanner) {
    if (scanner) {
        scanners_.push_back({std::move(scanner), std::make_unique<std::atomic<bool>>(false)});
    }
}

bool FallbackPortScanner::isDisabled(size_t index) const {
    return index < scanners_.size() && scanners_[index].disabled->load();
}

core::PortScanOutcome FallbackPortScanner::scanPorts(const std::string& ip,
                                                     const core::PortScanRequest& request,
                                                     Deadline deadline) {
    for (auto& entry : scanners_) {
        if (entry.disabled->load()) {
            continue;
        }
        try {
            return entry.scanner->scanPorts(ip, request, deadline);
        } catch (const core::PrivilegeError& e) {
            if (!entry.disabled->exchange(true)) {
                spdlog::warn("{} scanner disabled: {}", entry.scanner->name(), e.what());
            }
        } catch (const core::ToolUnavailableError& e) {
            if (!entry.disabled->exchange(true)) {
                spdlog::warn("{} scanner disabled: {}", entry.scanner->name(), e.what());
            }
        } catch (const std::exception& e) {
            spdlog::warn("{} scan of {} failed: {}", entry.scanner->name(), ip, e.what());
        }
    }

    spdlog::warn("No port scanner could scan {}", ip);
    core::PortScanOutcome outcome;
    outcome.method = "none";
    return outcome;
}

} // namespace netledger::infra
