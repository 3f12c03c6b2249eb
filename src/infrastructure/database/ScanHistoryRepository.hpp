#pragma once

#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace netledger::infra {

/**
 * @brief Outcome of a scan cycle as recorded in the history table.
 */
enum class ScanRunStatus { Completed, Cancelled, Failed };

/**
 * @brief One row of scan_runs.
 */
struct ScanRun {
    int64_t id{0};
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::string subnet;
    std::string discoverySource;
    int64_t hostsDiscovered{0};
    int64_t hostsAlive{0};
    int64_t hostsKnown{0};
    int64_t openPorts{0};
    int64_t durationMs{0};
    ScanRunStatus status{ScanRunStatus::Completed};

    static std::string statusToString(ScanRunStatus status);
    static ScanRunStatus statusFromString(const std::string& str);
};

/**
 * @brief Repository for the scan history stored in SQLite.
 */
class ScanHistoryRepository {
public:
    explicit ScanHistoryRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a run.
     * @return The new row id.
     */
    int64_t insert(const ScanRun& run);

    /**
     * @brief Most recent runs, newest first.
     */
    std::vector<ScanRun> recent(int limit);

    int64_t count();

    /**
     * @brief Deletes runs that started before the cutoff.
     * @return Number of rows removed.
     */
    int deleteOlderThan(std::chrono::system_clock::time_point cutoff);

private:
    std::shared_ptr<Database> db_;
};

} // namespace netledger::infra
