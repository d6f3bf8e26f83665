#include "common/file_lock.hpp"
#include "common/error.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <filesystem>
#include <system_error>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const std::string kPinTag = ".inuse.";

std::atomic<unsigned long> pinCounter{0};

bool processAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

FileLock::FileLock(const std::string& path)
    : path_(path) {
}

FileLock::~FileLock() {
    unlock();
}

bool FileLock::tryLock() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to open lock file " + path_ + ": " + strerror(errno));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return false;
        }
        throw BackupError(ErrorCode::IOError,
                          "Failed to lock " + path_ + ": " + strerror(err));
    }

    fd_ = fd;
    return true;
}

void FileLock::unlock() {
    if (fd_ < 0) {
        return;
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

ArchivePin::ArchivePin(const std::string& archivePath) {
    // One marker per holder: <archive>.inuse.<pid>.<seq>
    markerPath_ = archivePath + kPinTag + std::to_string(getpid()) + "." +
                  std::to_string(pinCounter.fetch_add(1));
    file_utils::writeFileAtomic(markerPath_, std::to_string(getpid()) + "\n");
    Logger::debug("Pinned " + archivePath);
}

ArchivePin::~ArchivePin() {
    file_utils::removeIfExists(markerPath_);
}

bool ArchivePin::isPinned(const std::string& archivePath) {
    fs::path archive(archivePath);
    std::string prefix = archive.filename().string() + kPinTag;
    fs::path dir = archive.parent_path().empty() ? fs::path(".") : archive.parent_path();

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string rest = name.substr(prefix.size());
        auto dot = rest.find('.');
        pid_t pid = 0;
        try {
            pid = static_cast<pid_t>(std::stol(rest.substr(0, dot)));
        } catch (const std::exception&) {
            Logger::warning("Ignoring malformed pin marker " + it->path().string());
            continue;
        }

        if (processAlive(pid)) {
            return true;
        }
        Logger::debug("Ignoring stale pin marker " + it->path().string());
    }

    if (ec) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to scan " + dir.string() + ": " + ec.message());
    }
    return false;
}
