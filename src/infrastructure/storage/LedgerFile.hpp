#pragma once

#include "core/types/HostRecord.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace netledger::infra {

/**
 * @brief Reads and writes the ledger CSV (netkb.csv).
 *
 * Header: Identity,IPs,Hostnames,Alive,Ports,FailedPings followed by any
 * extra columns. The legacy headers "MAC Address" and "Failed_Pings" are
 * accepted on read and written back under the current names.
 */
class LedgerFile {
public:
    explicit LedgerFile(std::filesystem::path path);

    /**
     * @brief Loads the ledger.
     *
     * A missing file yields an empty ledger. An unparseable file is copied
     * aside to "<name>.corrupt" and also yields an empty ledger. Never throws.
     */
    core::Ledger load() const;

    /**
     * @brief Persists the ledger atomically, ordered by IP.
     * @return True on success; failures are logged.
     */
    bool save(const core::Ledger& ledger) const;

    /**
     * @brief Parses ledger CSV content.
     * @throws std::runtime_error if the content has no identity column or is malformed.
     */
    static core::Ledger parse(std::istream& input);

    static std::string serialize(const core::Ledger& ledger);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace netledger::infra
