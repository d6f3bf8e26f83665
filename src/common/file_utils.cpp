#include "common/file_utils.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace file_utils {

std::string tempPathFor(const std::string& path, const std::string& tag) {
    fs::path p(path);
    std::string name = "." + p.filename().string() + "." + tag + "." + std::to_string(getpid());
    return (p.parent_path() / name).string();
}

void writeFileAtomic(const std::string& path, const std::string& content) {
    std::string tempPath = tempPathFor(path);

    int fd = open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to create " + tempPath + ": " + strerror(errno));
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            close(fd);
            unlink(tempPath.c_str());
            throw BackupError(ErrorCode::IOError,
                              "Failed to write " + tempPath + ": " + strerror(err));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (fsync(fd) != 0 || close(fd) != 0) {
        int err = errno;
        unlink(tempPath.c_str());
        throw BackupError(ErrorCode::IOError,
                          "Failed to flush " + tempPath + ": " + strerror(err));
    }

    if (rename(tempPath.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(tempPath.c_str());
        throw BackupError(ErrorCode::IOError,
                          "Failed to rename " + tempPath + " to " + path + ": " + strerror(err));
    }
}

void syncFile(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw BackupError(ErrorCode::IOError, "Failed to open " + path + ": " + strerror(errno));
    }
    if (fsync(fd) != 0) {
        int err = errno;
        close(fd);
        throw BackupError(ErrorCode::IOError, "Failed to sync " + path + ": " + strerror(err));
    }
    close(fd);
}

bool removeIfExists(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::error("Failed to remove " + path + ": " + ec.message());
        return false;
    }
    return true;
}

uint64_t fileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to stat " + path + ": " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

} // namespace file_utils
