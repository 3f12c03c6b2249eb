#include "app/InstanceLock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace netledger::app {

InstanceLock::InstanceLock(std::filesystem::path path) : path_(std::move(path)) {}

InstanceLock::~InstanceLock() {
    unlock();
}

bool InstanceLock::tryLock() {
    if (fd_ >= 0) {
        return true;
    }

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot open lock file " + path_.string() + ": " +
                                 std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        ::close(fd);
        if (error == EWOULDBLOCK) {
            spdlog::info("Another instance holds {}", path_.string());
            return false;
        }
        throw std::runtime_error("Cannot lock " + path_.string() + ": " + std::strerror(error));
    }

    auto pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::write(fd, pid.data(), pid.size()) < 0) {
        spdlog::debug("Could not record pid in {}", path_.string());
    }

    fd_ = fd;
    spdlog::debug("Acquired instance lock {}", path_.string());
    return true;
}

void InstanceLock::unlock() {
    if (fd_ < 0) {
        return;
    }
    if (::flock(fd_, LOCK_UN) != 0) {
        spdlog::warn("Could not release instance lock {}: {}", path_.string(),
                     std::strerror(errno));
    }
    ::close(fd_);
    fd_ = -1;
}

} // namespace netledger::app
