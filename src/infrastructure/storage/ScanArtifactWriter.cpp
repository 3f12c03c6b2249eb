#include "infrastructure/storage/ScanArtifactWriter.hpp"

#include "infrastructure/storage/Csv.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace netledger::infra {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char* pattern) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream out;
    out << std::put_time(&local, pattern);
    return out.str();
}

} // namespace

ScanArtifactWriter::ScanArtifactWriter(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::string ScanArtifactWriter::artifactStem(const core::ScanSnapshot& snapshot) {
    std::string network = snapshot.subnet.empty() ? "unknown" : snapshot.subnet;
    std::replace(network.begin(), network.end(), '/', '_');
    return network + "_" + formatTimestamp(snapshot.timestamp, "%Y%m%d_%H%M%S");
}

std::vector<std::vector<std::string>> ScanArtifactWriter::scanRows(
    const core::ScanSnapshot& snapshot) {
    std::vector<std::vector<std::string>> rows = {{"IP", "Hostname", "Identity", "Vendor"}};
    for (const auto& entry : snapshot.entries) {
        rows.push_back({entry.ip, entry.hostname, entry.identity, entry.vendor.value_or("")});
    }
    return rows;
}

std::vector<std::vector<std::string>> ScanArtifactWriter::resultRows(
    const core::ScanSnapshot& snapshot) {
    auto ports = snapshot.allPorts();

    std::vector<std::string> header = {"IP", "Hostname", "Alive", "Identity"};
    for (auto port : ports) {
        header.push_back(std::to_string(port));
    }

    std::vector<std::vector<std::string>> rows = {header};
    for (const auto& entry : snapshot.entries) {
        std::vector<std::string> row = {entry.ip, entry.hostname, "1", entry.identity};
        for (auto port : ports) {
            bool open = std::binary_search(entry.ports.begin(), entry.ports.end(), port);
            row.push_back(open ? std::to_string(port) : "");
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

ScanArtifacts ScanArtifactWriter::write(const core::ScanSnapshot& snapshot) const {
    auto stem = artifactStem(snapshot);
    ScanArtifacts artifacts;
    artifacts.scanFile = directory_ / ("scan_" + stem + ".csv");
    artifacts.resultFile = directory_ / ("result_" + stem + ".csv");

    writeFileAtomically(artifacts.scanFile, Csv::format(scanRows(snapshot)));
    writeFileAtomically(artifacts.resultFile, Csv::format(resultRows(snapshot)));

    spdlog::debug("Scan artifacts written: {}, {}", artifacts.scanFile.string(),
                  artifacts.resultFile.string());
    return artifacts;
}

size_t ScanArtifactWriter::prune(size_t keep) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return 0;
    }

    std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file(ec)) {
            auto mtime = entry.last_write_time(ec);
            if (!ec) {
                files.emplace_back(mtime, entry.path());
            }
        }
    }
    if (files.size() <= keep) {
        return 0;
    }

    // Newest first; ties broken by name so the result is deterministic
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second > b.second;
    });

    size_t removed = 0;
    for (size_t i = keep; i < files.size(); ++i) {
        if (std::filesystem::remove(files[i].second, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("Could not remove old artifact {}: {}", files[i].second.string(),
                         ec.message());
        }
    }
    spdlog::info("Scan results cleaned up: {} removed, {} kept", removed, keep);
    return removed;
}

nlohmann::json hostStatesToJson(const std::vector<core::HostStateView>& hosts,
                                std::chrono::system_clock::time_point updatedAt) {
    nlohmann::json j;
    j["updated_at"] = formatTimestamp(updatedAt, "%Y-%m-%dT%H:%M:%S");
    j["hosts"] = nlohmann::json::array();
    for (const auto& host : hosts) {
        j["hosts"].push_back({{"identity", host.identity},
                              {"ip", host.ip},
                              {"hostname", host.hostname},
                              {"ports", host.ports},
                              {"alive", host.alive}});
    }
    return j;
}

bool writeHostStates(const std::filesystem::path& path,
                     const std::vector<core::HostStateView>& hosts,
                     std::chrono::system_clock::time_point updatedAt) {
    try {
        writeFileAtomically(path, hostStatesToJson(hosts, updatedAt).dump(2));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write host states: {}", e.what());
        return false;
    }
}

} // namespace netledger::infra
