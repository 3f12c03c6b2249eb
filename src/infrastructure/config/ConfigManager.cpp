#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>

namespace netledger::infra {

namespace {

// Reads section[key], keeping the default when the key is missing or has the wrong type
template <typename T>
T readValue(const nlohmann::json& section, const char* key, const T& fallback) {
    if (!section.is_object() || !section.contains(key)) {
        return fallback;
    }
    try {
        return section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config key '{}' has the wrong type, using default: {}", key, e.what());
        return fallback;
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.is_object() && j.contains(name) && j.at(name).is_object()) {
        return j.at(name);
    }
    return empty;
}

int clampSetting(const char* name, int value, int low, int high, int& changes) {
    int clamped = std::clamp(value, low, high);
    if (clamped != value) {
        spdlog::warn("Config value {}={} out of range [{}, {}], using {}", name, value, low, high,
                     clamped);
        ++changes;
    }
    return clamped;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }
    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);
        validate();

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::filesystem::path ConfigManager::dataDir() const {
    if (config_.dataDir.empty()) {
        return configDir_ / "data";
    }
    std::filesystem::path dir(config_.dataDir);
    return dir.is_absolute() ? dir : configDir_ / dir;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["network"]["interface"] = config_.interfaceName;
    j["network"]["subnet"] = config_.subnetOverride;

    j["ports"]["range_start"] = config_.portRangeStart;
    j["ports"]["range_end"] = config_.portRangeEnd;
    j["ports"]["extra"] = config_.extraPorts;

    j["discovery"]["arp_scan_enabled"] = config_.arpScanEnabled;
    j["discovery"]["nmap_fallback_enabled"] = config_.nmapFallbackEnabled;
    j["discovery"]["ping_sweep_enabled"] = config_.pingSweepEnabled;
    j["discovery"]["ping_workers"] = config_.pingWorkers;
    j["discovery"]["ping_timeout_ms"] = config_.pingTimeoutMs;
    j["discovery"]["tool_timeout_seconds"] = config_.toolTimeoutSeconds;
    j["discovery"]["known_empty_ranges"] = config_.knownEmptyRanges;

    j["port_scan"]["workers"] = config_.portScanWorkers;
    j["port_scan"]["host_timeout_seconds"] = config_.hostTimeoutSeconds;
    j["port_scan"]["probe_timeout_ms"] = config_.probeTimeoutMs;
    j["port_scan"]["probe_concurrency"] = config_.probeConcurrency;
    j["port_scan"]["syn_scan_enabled"] = config_.synScanEnabled;

    j["hostnames"]["lookup_timeout_seconds"] = config_.hostnameLookupTimeoutSeconds;
    j["hostnames"]["netbios_enabled"] = config_.netbiosEnabled;

    j["ledger"]["max_failed_pings"] = config_.maxFailedPings;
    j["ledger"]["data_dir"] = config_.dataDir;
    j["ledger"]["artifacts_to_keep"] = config_.artifactsToKeep;
    j["ledger"]["history_retention_days"] = config_.historyRetentionDays;

    j["blacklist"]["enabled"] = config_.blacklistEnabled;
    j["blacklist"]["macs"] = config_.blacklistMacs;
    j["blacklist"]["ips"] = config_.blacklistIps;

    j["scheduler"]["interval_seconds"] = config_.intervalSeconds;

    j["logging"]["level"] = config_.logLevel;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    const auto& n = section(j, "network");
    config_.interfaceName = readValue(n, "interface", defaults.interfaceName);
    config_.subnetOverride = readValue(n, "subnet", defaults.subnetOverride);

    const auto& p = section(j, "ports");
    config_.portRangeStart = readValue(p, "range_start", defaults.portRangeStart);
    config_.portRangeEnd = readValue(p, "range_end", defaults.portRangeEnd);
    config_.extraPorts = readValue(p, "extra", defaults.extraPorts);

    const auto& d = section(j, "discovery");
    config_.arpScanEnabled = readValue(d, "arp_scan_enabled", defaults.arpScanEnabled);
    config_.nmapFallbackEnabled = readValue(d, "nmap_fallback_enabled", defaults.nmapFallbackEnabled);
    config_.pingSweepEnabled = readValue(d, "ping_sweep_enabled", defaults.pingSweepEnabled);
    config_.pingWorkers = readValue(d, "ping_workers", defaults.pingWorkers);
    config_.pingTimeoutMs = readValue(d, "ping_timeout_ms", defaults.pingTimeoutMs);
    config_.toolTimeoutSeconds = readValue(d, "tool_timeout_seconds", defaults.toolTimeoutSeconds);
    config_.knownEmptyRanges = readValue(d, "known_empty_ranges", defaults.knownEmptyRanges);

    const auto& s = section(j, "port_scan");
    config_.portScanWorkers = readValue(s, "workers", defaults.portScanWorkers);
    config_.hostTimeoutSeconds = readValue(s, "host_timeout_seconds", defaults.hostTimeoutSeconds);
    config_.probeTimeoutMs = readValue(s, "probe_timeout_ms", defaults.probeTimeoutMs);
    config_.probeConcurrency = readValue(s, "probe_concurrency", defaults.probeConcurrency);
    config_.synScanEnabled = readValue(s, "syn_scan_enabled", defaults.synScanEnabled);

    const auto& h = section(j, "hostnames");
    config_.hostnameLookupTimeoutSeconds =
        readValue(h, "lookup_timeout_seconds", defaults.hostnameLookupTimeoutSeconds);
    config_.netbiosEnabled = readValue(h, "netbios_enabled", defaults.netbiosEnabled);

    const auto& l = section(j, "ledger");
    config_.maxFailedPings = readValue(l, "max_failed_pings", defaults.maxFailedPings);
    config_.dataDir = readValue(l, "data_dir", defaults.dataDir);
    config_.artifactsToKeep = readValue(l, "artifacts_to_keep", defaults.artifactsToKeep);
    config_.historyRetentionDays =
        readValue(l, "history_retention_days", defaults.historyRetentionDays);

    const auto& b = section(j, "blacklist");
    config_.blacklistEnabled = readValue(b, "enabled", defaults.blacklistEnabled);
    config_.blacklistMacs = readValue(b, "macs", defaults.blacklistMacs);
    config_.blacklistIps = readValue(b, "ips", defaults.blacklistIps);

    config_.intervalSeconds =
        readValue(section(j, "scheduler"), "interval_seconds", defaults.intervalSeconds);

    config_.logLevel = readValue(section(j, "logging"), "level", defaults.logLevel);
}

int ConfigManager::validate() {
    int changes = 0;
    auto& c = config_;

    c.portRangeStart = clampSetting("ports.range_start", c.portRangeStart, 1, 65535, changes);
    c.portRangeEnd = clampSetting("ports.range_end", c.portRangeEnd, 1, 65535, changes);
    auto extraBefore = c.extraPorts.size();
    c.extraPorts.erase(std::remove_if(c.extraPorts.begin(), c.extraPorts.end(),
                                      [](int port) { return port < 1 || port > 65535; }),
                       c.extraPorts.end());
    if (c.extraPorts.size() != extraBefore) {
        spdlog::warn("Dropped {} extra ports outside 1-65535", extraBefore - c.extraPorts.size());
        ++changes;
    }

    c.pingWorkers = clampSetting("discovery.ping_workers", c.pingWorkers, 1, 256, changes);
    c.pingTimeoutMs = clampSetting("discovery.ping_timeout_ms", c.pingTimeoutMs, 50, 60000, changes);
    c.toolTimeoutSeconds =
        clampSetting("discovery.tool_timeout_seconds", c.toolTimeoutSeconds, 1, 3600, changes);

    c.portScanWorkers = clampSetting("port_scan.workers", c.portScanWorkers, 1, 256, changes);
    c.hostTimeoutSeconds =
        clampSetting("port_scan.host_timeout_seconds", c.hostTimeoutSeconds, 1, 3600, changes);
    c.probeTimeoutMs = clampSetting("port_scan.probe_timeout_ms", c.probeTimeoutMs, 10, 60000, changes);
    c.probeConcurrency =
        clampSetting("port_scan.probe_concurrency", c.probeConcurrency, 1, 1024, changes);

    c.hostnameLookupTimeoutSeconds = clampSetting(
        "hostnames.lookup_timeout_seconds", c.hostnameLookupTimeoutSeconds, 1, 60, changes);

    c.maxFailedPings = clampSetting("ledger.max_failed_pings", c.maxFailedPings, 1, 100000, changes);
    c.artifactsToKeep = clampSetting("ledger.artifacts_to_keep", c.artifactsToKeep, 1, 10000, changes);
    c.historyRetentionDays =
        clampSetting("ledger.history_retention_days", c.historyRetentionDays, 1, 3650, changes);

    c.intervalSeconds = clampSetting("scheduler.interval_seconds", c.intervalSeconds, 1, 86400, changes);

    static const std::array<const char*, 7> levels = {"trace", "debug", "info",    "warn",
                                                      "warning", "error", "critical"};
    if (std::find(levels.begin(), levels.end(), c.logLevel) == levels.end()) {
        spdlog::warn("Unknown log level '{}', using info", c.logLevel);
        c.logLevel = "info";
        ++changes;
    }

    return changes;
}

} // namespace netledger::infra
