#pragma once

#include "core/types/LiveStatus.hpp"

#include <filesystem>
#include <optional>

namespace netledger::infra {

/**
 * @brief The live-status summary (livestatus.csv): one header, one row.
 */
class SummaryFile {
public:
    explicit SummaryFile(std::filesystem::path path);

    /**
     * @brief Replaces the file with the given counters.
     * @return True on success; failures are logged.
     */
    bool write(const core::LiveStatus& status) const;

    /**
     * @brief Reads the counters back.
     * @return nullopt if the file is missing or malformed.
     */
    std::optional<core::LiveStatus> read() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace netledger::infra
