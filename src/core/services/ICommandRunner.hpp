/**
 * @file ICommandRunner.hpp
 * @brief Interface for running external tools under a hard timeout.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netledger::core {

/**
 * @brief How an external command ended.
 */
enum class CommandStatus {
    Completed,   ///< The process exited; see exitCode
    TimedOut,    ///< Killed after exceeding its timeout
    NotFound,    ///< The program is not installed
    LaunchFailed ///< The process could not be started
};

/**
 * @brief Exit information and combined stdout/stderr of a command.
 */
struct CommandResult {
    CommandStatus status{CommandStatus::LaunchFailed};
    int exitCode{-1};
    std::string output;

    [[nodiscard]] bool succeeded() const {
        return status == CommandStatus::Completed && exitCode == 0;
    }
};

/**
 * @brief Runs external programs.
 *
 * Discovery sources and scanners depend on this interface rather than on
 * popen() directly, so parsing can be tested against canned tool output.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Runs a program and captures its output.
     * @param argv Program followed by its arguments. Arguments are never
     *             interpreted by a shell.
     * @param timeout The process is killed once this elapses.
     */
    virtual CommandResult run(const std::vector<std::string>& argv,
                              std::chrono::seconds timeout) = 0;

    /**
     * @brief Checks whether a program can be found on PATH.
     */
    virtual bool isAvailable(const std::string& program) = 0;
};

} // namespace netledger::core
