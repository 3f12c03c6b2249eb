#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netledger::infra {

/**
 * @brief Application configuration settings.
 *
 * Mirrors the sections of config.json. Defaults apply to every key missing
 * from the file.
 */
struct AppConfig {
    // Network
    std::string interfaceName;  ///< Empty uses the default-route interface.
    std::string subnetOverride; ///< CIDR; empty derives the subnet from the interface.

    // Ports
    int portRangeStart{1};
    int portRangeEnd{1000};
    std::vector<int> extraPorts;

    // Discovery
    bool arpScanEnabled{true};
    bool nmapFallbackEnabled{true};
    bool pingSweepEnabled{true};
    int pingWorkers{4};
    int pingTimeoutMs{1000};
    int toolTimeoutSeconds{120};
    std::vector<std::string> knownEmptyRanges; ///< "a.b.c.d-e.f.g.h" or CIDR

    // Port scan
    int portScanWorkers{4};
    int hostTimeoutSeconds{30};
    int probeTimeoutMs{2000};
    int probeConcurrency{50};
    bool synScanEnabled{true};

    // Hostnames
    int hostnameLookupTimeoutSeconds{2};
    bool netbiosEnabled{true};

    // Ledger
    int maxFailedPings{15};
    std::string dataDir;          ///< Empty means <config dir>/data
    int artifactsToKeep{20};
    int historyRetentionDays{30};

    // Blacklist
    bool blacklistEnabled{false};
    std::vector<std::string> blacklistMacs;
    std::vector<std::string> blacklistIps;

    // Scheduler
    int intervalSeconds{300};

    // Logging
    std::string logLevel{"info"};
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads config.json from the configuration directory, writing a default file
 * when none exists. Unknown keys are ignored, keys of the wrong type fall back
 * to their default and out-of-range values are clamped, each with a warning.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded (or defaults written), false if the file is unreadable.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Directory holding the ledger, summary, artifacts, database and logs.
     *
     * A relative data_dir is resolved against the configuration directory.
     */
    std::filesystem::path dataDir() const;

    std::filesystem::path ledgerPath() const { return dataDir() / "netkb.csv"; }
    std::filesystem::path summaryPath() const { return dataDir() / "livestatus.csv"; }
    std::filesystem::path hostStatesPath() const { return dataDir() / "host_states.json"; }
    std::filesystem::path artifactsDir() const { return dataDir() / "scan_results"; }
    std::filesystem::path databasePath() const { return dataDir() / "netledger.db"; }
    std::filesystem::path logDir() const { return dataDir() / "logs"; }
    std::filesystem::path lockPath() const { return dataDir() / "netledger.lock"; }

    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    /**
     * @brief Clamps out-of-range values to their limits, logging each change.
     * @return Number of values that were changed.
     */
    int validate();

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netledger::infra
