#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace netledger::app {

/**
 * @brief Runs scan cycles back to back with a fixed pause in between.
 *
 * A cycle that throws is logged and counted as failed; the next cycle still
 * runs at the usual time.
 */
class CycleScheduler {
public:
    using Cycle = std::function<bool()>;

    explicit CycleScheduler(std::chrono::milliseconds interval);

    CycleScheduler(const CycleScheduler&) = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    /**
     * @brief Runs cycles until stopped, or a single cycle when once is set.
     * @return True if the last cycle that ran succeeded.
     */
    bool run(const Cycle& cycle, bool once);

    /**
     * @brief Stops the loop and wakes it from the interval wait.
     *
     * Safe to call from any thread.
     */
    void requestStop();

    [[nodiscard]] bool stopRequested() const { return stopRequested_.load(); }

    /// Flag polled by long-running phases inside a cycle.
    const std::atomic<bool>& stopFlag() const { return stopRequested_; }

    [[nodiscard]] int cyclesRun() const { return cyclesRun_; }
    [[nodiscard]] int cyclesFailed() const { return cyclesFailed_; }

private:
    bool runOne(const Cycle& cycle);

    std::chrono::milliseconds interval_;
    std::atomic<bool> stopRequested_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCondition_;
    int cyclesRun_{0};
    int cyclesFailed_{0};
};

} // namespace netledger::app
