#include "infrastructure/system/CommandRunner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace netledger::infra {

namespace {

// Exit codes reported by timeout(1) and the shell
constexpr int kExitTimedOut = 124;
constexpr int kExitKilled = 137;
constexpr int kExitNotExecutable = 126;
constexpr int kExitNotFound = 127;

} // namespace

std::string PosixCommandRunner::shellQuote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string PosixCommandRunner::buildCommandLine(const std::vector<std::string>& argv,
                                                 std::chrono::seconds timeout,
                                                 bool useTimeoutWrapper) {
    std::ostringstream command;
    if (useTimeoutWrapper) {
        command << "timeout --kill-after=2 " << std::max<long long>(timeout.count(), 1) << "s ";
    }
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            command << ' ';
        }
        command << shellQuote(argv[i]);
    }
    command << " 2>&1";
    return command.str();
}

bool PosixCommandRunner::findOnPath(const std::string& program) {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    std::istringstream dirs(path != nullptr ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool PosixCommandRunner::isAvailable(const std::string& program) {
    return findOnPath(program);
}

core::CommandResult PosixCommandRunner::run(const std::vector<std::string>& argv,
                                            std::chrono::seconds timeout) {
    core::CommandResult result;
    if (argv.empty()) {
        result.status = core::CommandStatus::LaunchFailed;
        return result;
    }

    if (!findOnPath(argv.front())) {
        result.status = core::CommandStatus::NotFound;
        result.exitCode = kExitNotFound;
        return result;
    }

    bool wrapped = findOnPath("timeout");
    if (!wrapped) {
        spdlog::warn("timeout(1) not found, running {} without a hard limit", argv.front());
    }
    auto command = buildCommandLine(argv, timeout, wrapped);
    spdlog::debug("Running: {}", command);

    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        result.status = core::CommandStatus::LaunchFailed;
        result.output = "failed to execute command: " + argv.front();
        return result;
    }

    char buffer[4096];
    while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
        result.output.append(buffer);
    }

    const int rawStatus = pclose(pipe);
    if (rawStatus == -1) {
        result.status = core::CommandStatus::LaunchFailed;
        return result;
    }
    if (!WIFEXITED(rawStatus)) {
        result.status = core::CommandStatus::TimedOut;
        result.exitCode = rawStatus;
        return result;
    }

    result.exitCode = WEXITSTATUS(rawStatus);
    switch (result.exitCode) {
    case kExitTimedOut:
    case kExitKilled:
        result.status = wrapped ? core::CommandStatus::TimedOut : core::CommandStatus::Completed;
        break;
    case kExitNotFound:
        result.status = core::CommandStatus::NotFound;
        break;
    case kExitNotExecutable:
        result.status = core::CommandStatus::LaunchFailed;
        break;
    default:
        result.status = core::CommandStatus::Completed;
        break;
    }
    return result;
}

} // namespace netledger::infra
