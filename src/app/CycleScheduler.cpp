#include "app/CycleScheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace netledger::app {

CycleScheduler::CycleScheduler(std::chrono::milliseconds interval) : interval_(interval) {}

bool CycleScheduler::run(const Cycle& cycle, bool once) {
    bool ok = true;
    while (!stopRequested_.load()) {
        ok = runOne(cycle);
        if (once) {
            break;
        }

        std::unique_lock lock(waitMutex_);
        spdlog::debug("Next cycle in {} s",
                      std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
        waitCondition_.wait_for(lock, interval_, [this]() { return stopRequested_.load(); });
    }
    return ok;
}

bool CycleScheduler::runOne(const Cycle& cycle) {
    ++cyclesRun_;
    bool ok = false;
    try {
        ok = cycle();
    } catch (const std::exception& e) {
        spdlog::error("Scan cycle aborted: {}", e.what());
    }
    if (!ok) {
        ++cyclesFailed_;
    }
    return ok;
}

void CycleScheduler::requestStop() {
    {
        std::lock_guard lock(waitMutex_);
        stopRequested_.store(true);
    }
    waitCondition_.notify_all();
}

} // namespace netledger::app
