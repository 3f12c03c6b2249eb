#include "infrastructure/database/ScanHistoryRepository.hpp"

namespace netledger::infra {

namespace {

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

std::string ScanRun::statusToString(ScanRunStatus status) {
    switch (status) {
    case ScanRunStatus::Completed:
        return "completed";
    case ScanRunStatus::Cancelled:
        return "cancelled";
    case ScanRunStatus::Failed:
        return "failed";
    }
    return "failed";
}

ScanRunStatus ScanRun::statusFromString(const std::string& str) {
    if (str == "completed") {
        return ScanRunStatus::Completed;
    }
    if (str == "cancelled") {
        return ScanRunStatus::Cancelled;
    }
    return ScanRunStatus::Failed;
}

ScanHistoryRepository::ScanHistoryRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

int64_t ScanHistoryRepository::insert(const ScanRun& run) {
    auto stmt = db_->prepare(R"(
        INSERT INTO scan_runs (started_at, finished_at, subnet, discovery_source,
                               hosts_discovered, hosts_alive, hosts_known, open_ports,
                               duration_ms, status)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, toEpochMillis(run.startedAt));
    stmt.bind(2, toEpochMillis(run.finishedAt));
    stmt.bind(3, run.subnet);
    stmt.bind(4, run.discoverySource);
    stmt.bind(5, run.hostsDiscovered);
    stmt.bind(6, run.hostsAlive);
    stmt.bind(7, run.hostsKnown);
    stmt.bind(8, run.openPorts);
    stmt.bind(9, run.durationMs);
    stmt.bind(10, ScanRun::statusToString(run.status));
    stmt.step();
    return db_->lastInsertRowId();
}

std::vector<ScanRun> ScanHistoryRepository::recent(int limit) {
    std::vector<ScanRun> runs;
    auto stmt = db_->prepare(R"(
        SELECT id, started_at, finished_at, subnet, discovery_source, hosts_discovered,
               hosts_alive, hosts_known, open_ports, duration_ms, status
        FROM scan_runs ORDER BY started_at DESC, id DESC LIMIT ?
    )");
    stmt.bind(1, limit);

    while (stmt.step()) {
        ScanRun run;
        run.id = stmt.columnInt64(0);
        run.startedAt = fromEpochMillis(stmt.columnInt64(1));
        run.finishedAt = fromEpochMillis(stmt.columnInt64(2));
        run.subnet = stmt.columnText(3);
        run.discoverySource = stmt.columnText(4);
        run.hostsDiscovered = stmt.columnInt64(5);
        run.hostsAlive = stmt.columnInt64(6);
        run.hostsKnown = stmt.columnInt64(7);
        run.openPorts = stmt.columnInt64(8);
        run.durationMs = stmt.columnInt64(9);
        run.status = ScanRun::statusFromString(stmt.columnText(10));
        runs.push_back(std::move(run));
    }
    return runs;
}

int64_t ScanHistoryRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM scan_runs");
    return stmt.step() ? stmt.columnInt64(0) : 0;
}

int ScanHistoryRepository::deleteOlderThan(std::chrono::system_clock::time_point cutoff) {
    auto stmt = db_->prepare("DELETE FROM scan_runs WHERE started_at < ?");
    stmt.bind(1, toEpochMillis(cutoff));
    stmt.step();
    return db_->changes();
}

} // namespace netledger::infra
