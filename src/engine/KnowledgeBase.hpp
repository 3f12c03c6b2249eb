/**
 * @file KnowledgeBase.hpp
 * @brief Owner of the persisted ledger and its derived outputs.
 */

#pragma once

#include "core/ledger/Reconciler.hpp"
#include "core/types/HostRecord.hpp"
#include "core/types/LiveStatus.hpp"
#include "core/types/ScanSnapshot.hpp"
#include "infrastructure/storage/LedgerFile.hpp"
#include "infrastructure/storage/SummaryFile.hpp"

#include <filesystem>
#include <functional>
#include <mutex>

namespace netledger::engine {

/**
 * @brief Paths of the files a KnowledgeBase maintains.
 */
struct KnowledgeBasePaths {
    std::filesystem::path ledger;     ///< netkb.csv
    std::filesystem::path summary;    ///< livestatus.csv
    std::filesystem::path hostStates; ///< host_states.json
};

/**
 * @brief Single writer for the host ledger.
 *
 * Every reconcile() runs load, merge and save under one mutex, then refreshes
 * the summary file and the host-state export. Listeners are notified after
 * the lock is released.
 */
class KnowledgeBase {
public:
    using ChangeCallback = std::function<void(const core::ReconcileReport&)>;

    KnowledgeBase(KnowledgeBasePaths paths, core::ReconcileOptions options);

    /**
     * @brief Merges a snapshot into the persisted ledger.
     * @throws std::runtime_error if the ledger cannot be written.
     */
    core::ReconcileReport reconcile(const core::ScanSnapshot& snapshot);

    void setChangeCallback(ChangeCallback callback);

    /**
     * @brief Counters computed from the ledger currently on disk.
     */
    core::LiveStatus liveStatus() const;

    /**
     * @brief Copy of the ledger currently on disk.
     */
    core::Ledger ledger() const;

    [[nodiscard]] const KnowledgeBasePaths& paths() const { return paths_; }

private:
    KnowledgeBasePaths paths_;
    infra::LedgerFile ledgerFile_;
    infra::SummaryFile summaryFile_;
    core::Reconciler reconciler_;
    ChangeCallback changeCallback_;
    mutable std::mutex mutex_;
};

} // namespace netledger::engine
