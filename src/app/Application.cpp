#include "app/Application.hpp"

#include "core/Errors.hpp"
#include "core/types/NetworkInterface.hpp"
#include "infrastructure/network/ArpScanDiscovery.hpp"
#include "infrastructure/network/ConnectPortScanner.hpp"
#include "infrastructure/network/HostnameResolvers.hpp"
#include "infrastructure/network/NmapDiscovery.hpp"
#include "infrastructure/network/NmapSynPortScanner.hpp"
#include "infrastructure/network/PingSweepDiscovery.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

namespace netledger::app {

namespace {

constexpr const char* kVersion = "1.0.0";

std::string formatTime(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

} // namespace

CommandLineOptions CommandLineOptions::parse(const std::vector<std::string>& args) {
    CommandLineOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--config-dir") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for --config-dir");
            }
            options.configDir = args[++i];
        } else if (arg == "--history") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for --history");
            }
            const auto& value = args[++i];
            int limit = 0;
            try {
                size_t consumed = 0;
                limit = std::stoi(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid value for --history: " + value);
            }
            if (limit <= 0) {
                throw std::invalid_argument("--history needs a positive count");
            }
            options.history = limit;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (options.configDir.empty()) {
        options.configDir = defaultConfigDir();
    }
    return options;
}

std::string CommandLineOptions::usage() {
    return "Usage: netledger [--config-dir DIR] [--once] [--history N] [--verbose]\n"
           "\n"
           "  --config-dir DIR  Directory holding config.json (default ~/.config/netledger)\n"
           "  --once            Run a single scan cycle and exit\n"
           "  --history N       Show the N most recent scan runs and exit\n"
           "  --verbose         Log debug output to the console\n";
}

std::filesystem::path CommandLineOptions::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "netledger";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "netledger";
    }
    return std::filesystem::current_path() / "netledger";
}

Application::Application(CommandLineOptions options) : options_(std::move(options)) {
    config_ = std::make_unique<infra::ConfigManager>(options_.configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }

    initializeLogging();
    initializeComponents();
    scheduler_ = std::make_unique<CycleScheduler>(
        std::chrono::seconds(config_->config().intervalSeconds));
}

Application::~Application() {
    spdlog::info("NetLedger shutting down...");

    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
    }
    if (signalContext_) {
        signalContext_->stop();
    }
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();
    auto logDir = config_->logDir();
    std::filesystem::create_directories(logDir);
    auto logPath = logDir / "netledger.log";

    auto consoleLevel = spdlog::level::from_str(cfg.logLevel);
    if (options_.verbose) {
        consoleLevel = spdlog::level::debug;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("netledger", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("NetLedger {} starting...", kVersion);
    spdlog::info("Config: {}", config_->configPath().string());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Database
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();
    history_ = std::make_unique<infra::ScanHistoryRepository>(database_);

    if (options_.history) {
        return;
    }

    // Network services
    commandRunner_ = std::make_unique<infra::PosixCommandRunner>();
    pingService_ = std::make_unique<infra::PingService>(*commandRunner_);
    neighborTable_ = std::make_unique<infra::NeighborTable>();

    portScanner_ = std::make_shared<infra::FallbackPortScanner>();
    if (cfg.synScanEnabled) {
        portScanner_->addScanner(std::make_unique<infra::NmapSynPortScanner>(*commandRunner_));
    }
    portScanner_->addScanner(std::make_unique<infra::ConnectPortScanner>());

    hostnameResolver_ = std::make_shared<core::HostnameResolverChain>(
        std::chrono::seconds(cfg.hostnameLookupTimeoutSeconds));
    hostnameResolver_->addResolver(std::make_unique<infra::ReverseDnsResolver>());
    hostnameResolver_->addResolver(std::make_unique<infra::GetentResolver>(*commandRunner_));
    if (cfg.netbiosEnabled) {
        hostnameResolver_->addResolver(std::make_unique<infra::NetbiosResolver>(*commandRunner_));
    }

    // Knowledge base
    core::ReconcileOptions reconcileOptions;
    reconcileOptions.failedPingThreshold = cfg.maxFailedPings;
    reconcileOptions.blacklistEnabled = cfg.blacklistEnabled;
    reconcileOptions.identityBlacklist = {cfg.blacklistMacs.begin(), cfg.blacklistMacs.end()};
    reconcileOptions.ipBlacklist = {cfg.blacklistIps.begin(), cfg.blacklistIps.end()};

    knowledgeBase_ = std::make_unique<engine::KnowledgeBase>(
        engine::KnowledgeBasePaths{config_->ledgerPath(), config_->summaryPath(),
                                   config_->hostStatesPath()},
        std::move(reconcileOptions));
    knowledgeBase_->setChangeCallback([](const core::ReconcileReport& report) {
        for (const auto& identity : report.wentOffline) {
            spdlog::info("Host {} went offline", identity);
        }
    });

    artifactWriter_ = std::make_unique<infra::ScanArtifactWriter>(config_->artifactsDir());

    spdlog::info("Application components initialized");
}

void Application::installSignalHandlers() {
    signalContext_ = std::make_unique<infra::AsioContext>(1, "signals");
    signals_ = std::make_unique<asio::signal_set>(signalContext_->getContext(), SIGINT, SIGTERM);
    signals_->async_wait([this](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::warn("Received signal {}, stopping after the current phase", signalNumber);
        requestStop();
    });
    signalContext_->start();
}

void Application::requestStop() {
    scheduler_->requestStop();
}

int Application::run() {
    if (options_.history) {
        printHistory(*options_.history);
        return 0;
    }

    instanceLock_ = std::make_unique<InstanceLock>(config_->lockPath());
    if (!instanceLock_->tryLock()) {
        spdlog::error("Another NetLedger instance owns {}", config_->dataDir().string());
        return 1;
    }

    installSignalHandlers();

    bool ok = scheduler_->run([this]() { return runCycle(); }, options_.once);
    spdlog::info("{} scan cycles run, {} failed", scheduler_->cyclesRun(),
                 scheduler_->cyclesFailed());
    return ok ? 0 : 1;
}

bool Application::runCycle() {
    const auto& cfg = config_->config();
    auto started = std::chrono::system_clock::now();

    auto selection = core::selectScanSubnet(cfg.subnetOverride, cfg.interfaceName,
                                            core::NetworkInterfaceEnumerator::enumerate(),
                                            core::NetworkInterfaceEnumerator::defaultRouteInterface());
    if (selection.source == "fallback") {
        spdlog::warn("Could not determine the local subnet, scanning {}",
                     selection.subnet.toString());
    } else {
        spdlog::info("Scanning {} ({}{})", selection.subnet.toString(), selection.source,
                     selection.interfaceName.empty() ? "" : ", " + selection.interfaceName);
    }

    infra::ScanRun run;
    run.startedAt = started;
    run.subnet = selection.subnet.toString();

    auto finish = [&](infra::ScanRunStatus status) {
        run.finishedAt = std::chrono::system_clock::now();
        run.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             run.finishedAt - run.startedAt)
                             .count();
        run.status = status;
        recordRun(run);
    };

    engine::ScanOrchestrator orchestrator(buildDiscoveryPlan(selection.interfaceName),
                                          portScanner_, hostnameResolver_, buildScanOptions());

    std::optional<core::ScanSnapshot> snapshot;
    try {
        snapshot = orchestrator.run(selection.subnet, scheduler_->stopFlag());
    } catch (const core::DiscoveryUnavailableError& e) {
        spdlog::error("Scan cycle failed: {}", e.what());
        finish(infra::ScanRunStatus::Failed);
        return false;
    }

    if (!snapshot) {
        finish(infra::ScanRunStatus::Cancelled);
        return true;
    }

    run.discoverySource = snapshot->discoverySource;
    run.hostsDiscovered = static_cast<int64_t>(snapshot->entries.size());

    try {
        auto artifacts = artifactWriter_->write(*snapshot);
        spdlog::debug("Wrote {} and {}", artifacts.scanFile.string(), artifacts.resultFile.string());
    } catch (const std::exception& e) {
        spdlog::warn("Could not write scan artifacts: {}", e.what());
    }

    core::ReconcileReport report;
    try {
        report = knowledgeBase_->reconcile(*snapshot);
    } catch (const std::exception&) {
        finish(infra::ScanRunStatus::Failed);
        throw;
    }

    run.hostsAlive = report.liveStatus.aliveCount;
    run.hostsKnown = report.liveStatus.totalKnownCount;
    run.openPorts = report.liveStatus.totalOpenPorts;
    finish(scheduler_->stopRequested() ? infra::ScanRunStatus::Cancelled
                                 : infra::ScanRunStatus::Completed);

    performHousekeeping();
    return true;
}

engine::DiscoveryPlan Application::buildDiscoveryPlan(const std::string& interfaceName) {
    const auto& cfg = config_->config();
    auto toolTimeout = std::chrono::seconds(cfg.toolTimeoutSeconds);

    engine::DiscoveryPlan plan;
    if (cfg.arpScanEnabled) {
        infra::ArpScanDiscovery::Options arpOptions;
        arpOptions.interfaceName = cfg.interfaceName.empty() ? interfaceName : cfg.interfaceName;
        arpOptions.toolTimeout = toolTimeout;
        plan.primary = std::make_shared<infra::ArpScanDiscovery>(*commandRunner_, arpOptions);
    }
    if (cfg.nmapFallbackEnabled) {
        plan.fallback = std::make_shared<infra::NmapDiscovery>(*commandRunner_, toolTimeout);
    }
    if (cfg.pingSweepEnabled) {
        infra::PingSweepDiscovery::Options pingOptions;
        pingOptions.workers = static_cast<size_t>(cfg.pingWorkers);
        pingOptions.timeout = std::chrono::milliseconds(cfg.pingTimeoutMs);
        for (const auto& text : cfg.knownEmptyRanges) {
            if (auto range = core::Ipv4Range::parse(text)) {
                pingOptions.knownEmptyRanges.push_back(*range);
            } else {
                spdlog::warn("Ignoring malformed known-empty range '{}'", text);
            }
        }
        plan.supplementary = std::make_shared<infra::PingSweepDiscovery>(
            *pingService_, *neighborTable_, std::move(pingOptions));
    }
    return plan;
}

engine::ScanOptions Application::buildScanOptions() const {
    const auto& cfg = config_->config();

    engine::ScanOptions options;
    options.workers = static_cast<size_t>(cfg.portScanWorkers);
    options.hostTimeout = std::chrono::seconds(cfg.hostTimeoutSeconds);
    options.request.rangeStart = cfg.portRangeStart;
    options.request.rangeEnd = cfg.portRangeEnd;
    options.request.extraPorts = cfg.extraPorts;
    options.request.probeTimeout = std::chrono::milliseconds(cfg.probeTimeoutMs);
    options.request.maxConcurrentProbes = cfg.probeConcurrency;
    options.blacklistEnabled = cfg.blacklistEnabled;
    options.blacklistMacs = {cfg.blacklistMacs.begin(), cfg.blacklistMacs.end()};
    options.blacklistIps = {cfg.blacklistIps.begin(), cfg.blacklistIps.end()};
    return options;
}

void Application::recordRun(infra::ScanRun run) {
    try {
        history_->insert(run);
    } catch (const std::exception& e) {
        spdlog::warn("Could not record scan run: {}", e.what());
    }
}

void Application::performHousekeeping() {
    const auto& cfg = config_->config();

    try {
        auto removed = artifactWriter_->prune(static_cast<size_t>(cfg.artifactsToKeep));
        if (removed > 0) {
            spdlog::debug("Pruned {} old scan artifacts", removed);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Artifact cleanup failed: {}", e.what());
    }

    try {
        auto cutoff = std::chrono::system_clock::now() -
                      std::chrono::hours(24 * cfg.historyRetentionDays);
        auto removed = history_->deleteOlderThan(cutoff);
        if (removed > 0) {
            spdlog::debug("Removed {} scan runs older than {} days", removed,
                          cfg.historyRetentionDays);
        }
    } catch (const std::exception& e) {
        spdlog::warn("History cleanup failed: {}", e.what());
    }
}

void Application::printHistory(int limit) {
    auto runs = history_->recent(limit);
    spdlog::info("{} of {} recorded scan runs", runs.size(), history_->count());
    for (const auto& run : runs) {
        spdlog::info("#{} {} {} via {}: {} discovered, {} alive / {} known, {} open ports, "
                     "{} ms, {}",
                     run.id, formatTime(run.startedAt), run.subnet,
                     run.discoverySource.empty() ? "-" : run.discoverySource, run.hostsDiscovered,
                     run.hostsAlive, run.hostsKnown, run.openPorts, run.durationMs,
                     infra::ScanRun::statusToString(run.status));
    }
}

} // namespace netledger::app
