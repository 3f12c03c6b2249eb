#pragma once

#include "core/services/ICommandRunner.hpp"

#include <string>
#include <vector>

namespace netledger::infra {

/**
 * @brief Runs external tools through popen() under timeout(1).
 *
 * Every command is wrapped as `timeout --kill-after=2 <N>s <argv...>` with
 * stderr merged into stdout, so a hung tool is killed once its budget is
 * spent. Arguments are single-quoted and never interpreted by the shell.
 */
class PosixCommandRunner : public core::ICommandRunner {
public:
    core::CommandResult run(const std::vector<std::string>& argv,
                            std::chrono::seconds timeout) override;

    bool isAvailable(const std::string& program) override;

    /**
     * @brief Quotes one argument for /bin/sh.
     */
    static std::string shellQuote(const std::string& argument);

    /**
     * @brief Builds the full shell command line for argv and timeout.
     */
    static std::string buildCommandLine(const std::vector<std::string>& argv,
                                        std::chrono::seconds timeout, bool useTimeoutWrapper);

    /**
     * @brief Searches PATH for an executable file.
     */
    static bool findOnPath(const std::string& program);
};

} // namespace netledger::infra
