#include "infrastructure/storage/SummaryFile.hpp"

#include "infrastructure/storage/Csv.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace netledger::infra {

namespace {

const CsvRow kHeader = {"TotalOpenPorts", "AliveHostsCount", "AllKnownHostsCount"};

} // namespace

SummaryFile::SummaryFile(std::filesystem::path path) : path_(std::move(path)) {}

bool SummaryFile::write(const core::LiveStatus& status) const {
    std::vector<CsvRow> rows = {kHeader,
                                {std::to_string(status.totalOpenPorts),
                                 std::to_string(status.aliveCount),
                                 std::to_string(status.totalKnownCount)}};
    try {
        writeFileAtomically(path_, Csv::format(rows));
        spdlog::debug("Live status written to {}", path_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write live status: {}", e.what());
        return false;
    }
}

std::optional<core::LiveStatus> SummaryFile::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    try {
        auto rows = Csv::parse(file);
        if (rows.size() < 2 || rows[0] != kHeader || rows[1].size() != kHeader.size()) {
            return std::nullopt;
        }
        core::LiveStatus status;
        status.totalOpenPorts = std::stoll(rows[1][0]);
        status.aliveCount = std::stoll(rows[1][1]);
        status.totalKnownCount = std::stoll(rows[1][2]);
        return status;
    } catch (const std::exception& e) {
        spdlog::warn("Live status file {} unreadable: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

} // namespace netledger::infra
