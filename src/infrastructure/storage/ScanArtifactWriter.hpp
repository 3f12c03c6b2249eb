#pragma once

#include "core/types/HostRecord.hpp"
#include "core/types/ScanSnapshot.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netledger::infra {

/**
 * @brief Paths of the two audit files written for one scan.
 */
struct ScanArtifacts {
    std::filesystem::path scanFile;   ///< scan_<network>_<ts>.csv
    std::filesystem::path resultFile; ///< result_<network>_<ts>.csv
};

/**
 * @brief Writes per-scan audit artifacts and the collaborator host-state export.
 */
class ScanArtifactWriter {
public:
    explicit ScanArtifactWriter(std::filesystem::path directory);

    /**
     * @brief Writes the scan and result CSVs for a snapshot.
     * @throws std::runtime_error if either file cannot be written.
     */
    ScanArtifacts write(const core::ScanSnapshot& snapshot) const;

    /**
     * @brief Deletes all but the newest files in the artifact directory.
     * @param keep Number of files to keep, by modification time.
     * @return Number of files removed.
     */
    size_t prune(size_t keep) const;

    /**
     * @brief File-name stem for a snapshot: "<network>_<YYYYmmdd_HHMMSS>".
     */
    static std::string artifactStem(const core::ScanSnapshot& snapshot);

    static std::vector<std::vector<std::string>> scanRows(const core::ScanSnapshot& snapshot);
    static std::vector<std::vector<std::string>> resultRows(const core::ScanSnapshot& snapshot);

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

/**
 * @brief Serializes host states for external consumers.
 */
nlohmann::json hostStatesToJson(const std::vector<core::HostStateView>& hosts,
                                std::chrono::system_clock::time_point updatedAt);

/**
 * @brief Writes host_states.json atomically.
 * @return True on success; failures are logged.
 */
bool writeHostStates(const std::filesystem::path& path,
                     const std::vector<core::HostStateView>& hosts,
                     std::chrono::system_clock::time_point updatedAt);

} // namespace netledger::infra
