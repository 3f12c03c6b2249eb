#pragma once

#include "app/CycleScheduler.hpp"
#include "app/InstanceLock.hpp"
#include "core/identity/HostnameResolverChain.hpp"
#include "engine/KnowledgeBase.hpp"
#include "engine/ScanOrchestrator.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ScanHistoryRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/FallbackPortScanner.hpp"
#include "infrastructure/network/NeighborTable.hpp"
#include "infrastructure/network/PingService.hpp"
#include "infrastructure/storage/ScanArtifactWriter.hpp"
#include "infrastructure/system/CommandRunner.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netledger::app {

/**
 * @brief Parsed command line.
 */
struct CommandLineOptions {
    std::filesystem::path configDir;
    bool once{false};
    std::optional<int> history; ///< Print this many recent runs and exit
    bool verbose{false};
    bool help{false};

    /**
     * @brief Parses argv.
     * @throws std::invalid_argument on unknown options or missing values.
     */
    static CommandLineOptions parse(const std::vector<std::string>& args);

    static std::string usage();

    /**
     * @brief $XDG_CONFIG_HOME/netledger, falling back to ~/.config/netledger.
     */
    static std::filesystem::path defaultConfigDir();
};

/**
 * @brief Wires the components together and runs scan cycles.
 */
class Application {
public:
    explicit Application(CommandLineOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs until stopped (or one cycle with --once).
     * @return Process exit code.
     */
    int run();

    /**
     * @brief One select-scan-reconcile-record cycle.
     * @return False if the cycle failed.
     * @throws std::runtime_error if the data directory is unusable.
     */
    bool runCycle();

    /**
     * @brief Asks the running cycle and the scheduler loop to stop.
     */
    void requestStop();

    infra::ConfigManager& config() { return *config_; }
    engine::KnowledgeBase& knowledgeBase() { return *knowledgeBase_; }
    infra::ScanHistoryRepository& history() { return *history_; }

private:
    void initializeLogging();
    void initializeComponents();
    void installSignalHandlers();
    void printHistory(int limit);
    engine::DiscoveryPlan buildDiscoveryPlan(const std::string& interfaceName);
    engine::ScanOptions buildScanOptions() const;
    void recordRun(infra::ScanRun run);
    void performHousekeeping();

    CommandLineOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<InstanceLock> instanceLock_;
    std::unique_ptr<infra::PosixCommandRunner> commandRunner_;
    std::unique_ptr<infra::PingService> pingService_;
    std::unique_ptr<infra::NeighborTable> neighborTable_;
    std::shared_ptr<infra::FallbackPortScanner> portScanner_;
    std::shared_ptr<core::HostnameResolverChain> hostnameResolver_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<infra::ScanHistoryRepository> history_;
    std::unique_ptr<engine::KnowledgeBase> knowledgeBase_;
    std::unique_ptr<infra::ScanArtifactWriter> artifactWriter_;

    std::unique_ptr<infra::AsioContext> signalContext_;
    std::unique_ptr<asio::signal_set> signals_;

    std::unique_ptr<CycleScheduler> scheduler_;
};

} // namespace netledger::app
