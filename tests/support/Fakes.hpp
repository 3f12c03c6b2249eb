#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IDiscoverySource.hpp"
#include "core/services/IHostnameResolver.hpp"
#include "core/services/IPingService.hpp"
#include "core/services/IPortScanner.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace netledger::testing {

/**
 * @brief Command runner returning canned results per program name.
 */
class FakeCommandRunner : public core::ICommandRunner {
public:
    void setResult(const std::string& program, core::CommandResult result) {
        std::lock_guard lock(mutex_);
        results_[program] = std::move(result);
        available_.insert(program);
    }

    void setOutput(const std::string& program, std::string output, int exitCode = 0) {
        setResult(program, {core::CommandStatus::Completed, exitCode, std::move(output)});
    }

    core::CommandResult run(const std::vector<std::string>& argv,
                            std::chrono::seconds timeout) override {
        std::lock_guard lock(mutex_);
        calls_.push_back(argv);
        lastTimeout_ = timeout;
        auto it = results_.find(argv.empty() ? "" : argv.front());
        if (it == results_.end()) {
            return {core::CommandStatus::NotFound, 127, ""};
        }
        return it->second;
    }

    bool isAvailable(const std::string& program) override {
        std::lock_guard lock(mutex_);
        return available_.count(program) > 0;
    }

    std::vector<std::vector<std::string>> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::chrono::seconds lastTimeout() const {
        std::lock_guard lock(mutex_);
        return lastTimeout_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, core::CommandResult> results_;
    std::set<std::string> available_;
    std::vector<std::vector<std::string>> calls_;
    std::chrono::seconds lastTimeout_{0};
};

/**
 * @brief Pinger that answers for a fixed set of addresses.
 */
class FakePinger : public core::IPingService {
public:
    explicit FakePinger(std::set<std::string> alive = {}, bool isAvailable = true)
        : alive_(std::move(alive)), available_(isAvailable) {}

    void setAlive(std::set<std::string> alive) {
        std::lock_guard lock(mutex_);
        alive_ = std::move(alive);
    }

    core::PingResult ping(const std::string& address, std::chrono::milliseconds) override {
        core::PingResult result;
        {
            std::lock_guard lock(mutex_);
            probed_.push_back(address);
            result.success = alive_.count(address) > 0;
        }
        result.address = address;
        result.method = "fake";
        if (result.success) {
            result.latency = std::chrono::microseconds(500);
        } else {
            result.errorMessage = "timeout";
        }
        return result;
    }

    bool available() override { return available_; }

    std::vector<std::string> probed() const {
        std::lock_guard lock(mutex_);
        return probed_;
    }

private:
    std::set<std::string> alive_;
    bool available_;
    mutable std::mutex mutex_;
    std::vector<std::string> probed_;
};

/**
 * @brief Port scanner returning a fixed port list per address.
 */
class FakePortScanner : public core::IPortScanner {
public:
    using Behavior = std::function<core::PortScanOutcome(const std::string&)>;

    explicit FakePortScanner(std::map<std::string, std::vector<uint16_t>> ports = {},
                             std::string scannerName = "fake")
        : ports_(std::move(ports)), name_(std::move(scannerName)) {}

    void setBehavior(Behavior behavior) { behavior_ = std::move(behavior); }

    core::PortScanOutcome scanPorts(const std::string& ip, const core::PortScanRequest&,
                                    Deadline) override {
        calls_.fetch_add(1);
        if (behavior_) {
            return behavior_(ip);
        }
        core::PortScanOutcome outcome;
        outcome.method = name_;
        auto it = ports_.find(ip);
        if (it != ports_.end()) {
            outcome.openPorts = it->second;
        }
        return outcome;
    }

    [[nodiscard]] std::string name() const override { return name_; }

    int calls() const { return calls_.load(); }

private:
    std::map<std::string, std::vector<uint16_t>> ports_;
    std::string name_;
    Behavior behavior_;
    std::atomic<int> calls_{0};
};

/**
 * @brief Scanner that always throws the given exception type.
 */
template <typename Error>
class ThrowingPortScanner : public core::IPortScanner {
public:
    explicit ThrowingPortScanner(std::string scannerName) : name_(std::move(scannerName)) {}

    core::PortScanOutcome scanPorts(const std::string&, const core::PortScanRequest&,
                                    Deadline) override {
        calls_.fetch_add(1);
        throw Error(name_ + " cannot scan");
    }

    [[nodiscard]] std::string name() const override { return name_; }

    int calls() const { return calls_.load(); }

private:
    std::string name_;
    std::atomic<int> calls_{0};
};

/**
 * @brief Discovery source returning a canned outcome.
 */
class FakeDiscoverySource : public core::IDiscoverySource {
public:
    FakeDiscoverySource(std::string sourceName, core::DiscoveryOutcome outcome)
        : name_(std::move(sourceName)), outcome_(std::move(outcome)) {}

    core::DiscoveryOutcome discover(const core::Subnet&,
                                    const core::DiscoveryContext& context) override {
        ++calls_;
        if (context.alreadyFound != nullptr) {
            seenKnown_ = context.alreadyFound->size();
        }
        if (onDiscover) {
            onDiscover();
        }
        return outcome_;
    }

    [[nodiscard]] std::string name() const override { return name_; }

    int calls() const { return calls_; }
    size_t seenKnown() const { return seenKnown_; }

    std::function<void()> onDiscover;

private:
    std::string name_;
    core::DiscoveryOutcome outcome_;
    int calls_{0};
    size_t seenKnown_{0};
};

/**
 * @brief Hostname resolver with a fixed answer table.
 */
class FakeHostnameResolver : public core::IHostnameResolver {
public:
    FakeHostnameResolver(std::string resolverName, std::map<std::string, std::string> names)
        : name_(std::move(resolverName)), names_(std::move(names)) {}

    std::optional<std::string> resolve(const std::string& ip,
                                       std::chrono::milliseconds timeout) override {
        lastTimeoutMs_.store(timeout.count());
        calls_.fetch_add(1);
        auto it = names_.find(ip);
        if (it == names_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::string name() const override { return name_; }

    int calls() const { return calls_.load(); }
    std::chrono::milliseconds lastTimeout() const {
        return std::chrono::milliseconds(lastTimeoutMs_.load());
    }

private:
    std::string name_;
    std::map<std::string, std::string> names_;
    std::atomic<int> calls_{0};
    std::atomic<int64_t> lastTimeoutMs_{0};
};

/**
 * @brief Temporary directory removed on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "netledger_test") {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

} // namespace netledger::testing
