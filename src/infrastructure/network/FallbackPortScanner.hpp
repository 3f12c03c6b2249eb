#pragma once

#include "core/services/IPortScanner.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace netledger::infra {

/**
 * @brief Ordered chain of port scanners.
 *
 * Tries each scanner in turn and re-runs the whole scan with the next one on
 * any error. A scanner that fails for lack of privilege or a missing tool is
 * skipped for the rest of the process lifetime. When the chain is exhausted
 * the host gets an empty result.
 */
class FallbackPortScanner : public core::IPortScanner {
public:
    void addScanner(std::unique_ptr<core::IPortScanner> scanner);

    core::PortScanOutcome scanPorts(const std::string& ip, const core::PortScanRequest& request,
                                    Deadline deadline) override;

    [[nodiscard]] std::string name() const override { return "fallback"; }

    [[nodiscard]] size_t size() const { return scanners_.size(); }

    /**
     * @brief Whether a scanner has been disabled after a privilege or tool error.
     */
    [[nodiscard]] bool isDisabled(size_t index) const;

private:
    struct Entry {
        std::unique_ptr<core::IPortScanner> scanner;
        std::unique_ptr<std::atomic<bool>> disabled;
    };

    std::vector<Entry> scanners_;
};

} // namespace netledger::infra
