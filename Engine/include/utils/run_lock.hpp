#pragma once

#include <utils/logger.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

namespace Instasave {

/**
 * @brief Exclusive lock file held for the lifetime of a run.
 *
 * The file is created with O_EXCL and removed on destruction, so a second
 * run against the same media root refuses to start while the first is alive.
 */
class RunLock {
public:
    explicit RunLock(std::filesystem::path path) : path_(std::move(path)) {
        std::error_code ec;
        if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);

        fd_ = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
        if (fd_ < 0) {
            if (errno == EEXIST) {
                throw std::runtime_error("Another run holds " + path_.string() +
                                         "; remove it if no run is active");
            }
            throw std::runtime_error("Cannot create lock " + path_.string() + ": " + std::strerror(errno));
        }

        std::string pid = std::to_string(::getpid()) + "\n";
        if (::write(fd_, pid.data(), pid.size()) < 0) {
            Logger::warn("Cannot write pid into " + path_.string());
        }
    }

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    ~RunLock() {
        if (fd_ >= 0) ::close(fd_);
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) Logger::warn("Cannot remove lock " + path_.string() + ": " + ec.message());
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace Instasave
