/**
 * @file Errors.hpp
 * @brief Exception types raised across the scan pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace netledger::core {

/**
 * @brief The operation needs a privilege (raw sockets, root) the process lacks.
 */
class PrivilegeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A required external tool is not installed or cannot be started.
 */
class ToolUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No discovery source could run at all, so the cycle is meaningless.
 */
class DiscoveryUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace netledger::core
