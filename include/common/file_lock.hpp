#pragma once

#include <string>

// Advisory exclusive lock (flock) held for the lifetime of the object
class FileLock {
public:
    explicit FileLock(const std::string& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Non-blocking; false when another holder has the lock
    bool tryLock();
    void unlock();
    bool isLocked() const { return fd_ >= 0; }
    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
};

// "In use" lease on an archive. Cleanup never deletes an archive that has a
// live pin; a pin whose owning process is gone is ignored.
class ArchivePin {
public:
    explicit ArchivePin(const std::string& archivePath);
    ~ArchivePin();

    ArchivePin(const ArchivePin&) = delete;
    ArchivePin& operator=(const ArchivePin&) = delete;

    const std::string& getMarkerPath() const { return markerPath_; }

    static bool isPinned(const std::string& archivePath);

private:
    std::string markerPath_;
};
