#pragma once

#include <filesystem>

namespace netledger::app {

/**
 * @brief Advisory lock that lets one process own the data directory.
 *
 * Backed by flock() on a lock file, so a crashed process never leaves a
 * stale lock behind.
 *
 * @note Non-copyable. The lock is released on destruction.
 */
class InstanceLock {
public:
    explicit InstanceLock(std::filesystem::path path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /**
     * @brief Tries to take the lock without blocking.
     * @return False if another process holds it.
     * @throws std::runtime_error if the lock file cannot be opened.
     */
    bool tryLock();

    void unlock();

    bool isLocked() const { return fd_ >= 0; }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

} // namespace netledger::app
