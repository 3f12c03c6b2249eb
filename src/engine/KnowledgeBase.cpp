#include "engine/KnowledgeBase.hpp"

#include "core/ledger/LiveStatusAggregator.hpp"
#include "infrastructure/storage/ScanArtifactWriter.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace netledger::engine {

KnowledgeBase::KnowledgeBase(KnowledgeBasePaths paths, core::ReconcileOptions options)
    : paths_(std::move(paths)), ledgerFile_(paths_.ledger), summaryFile_(paths_.summary),
      reconciler_(std::move(options)) {}

core::ReconcileReport KnowledgeBase::reconcile(const core::ScanSnapshot& snapshot) {
    core::ReconcileReport report;
    ChangeCallback callback;
    {
        std::lock_guard lock(mutex_);

        auto ledger = ledgerFile_.load();
        report = reconciler_.reconcile(ledger, snapshot);

        if (!ledgerFile_.save(ledger)) {
            throw std::runtime_error("Cannot write ledger " + paths_.ledger.string());
        }
        if (!summaryFile_.write(report.liveStatus)) {
            spdlog::warn("Live status not updated");
        }
        if (!paths_.hostStates.empty() &&
            !infra::writeHostStates(paths_.hostStates, report.upserted, snapshot.timestamp)) {
            spdlog::warn("Host-state export not updated");
        }
        callback = changeCallback_;
    }

    spdlog::info("Ledger updated: {} hosts upserted, {} went offline, {} pruned, "
                 "{} alive of {} known, {} open ports",
                 report.upserted.size(), report.wentOffline.size(), report.prunedAmbiguous.size(),
                 report.liveStatus.aliveCount, report.liveStatus.totalKnownCount,
                 report.liveStatus.totalOpenPorts);

    if (callback) {
        callback(report);
    }
    return report;
}

void KnowledgeBase::setChangeCallback(ChangeCallback callback) {
    std::lock_guard lock(mutex_);
    changeCallback_ = std::move(callback);
}

core::LiveStatus KnowledgeBase::liveStatus() const {
    std::lock_guard lock(mutex_);
    return core::LiveStatusAggregator::aggregate(ledgerFile_.load());
}

core::Ledger KnowledgeBase::ledger() const {
    std::lock_guard lock(mutex_);
    return ledgerFile_.load();
}

} // namespace netledger::engine
