#pragma once

#include "backup/backup_config.hpp"
#include "backup/hook_runner.hpp"
#include "backup/metadata_store.hpp"
#include "common/backup_status.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct ArchiveResult {
    std::string archivePath;
    BackupMetadata metadata;
    std::vector<std::string> warnings;
};

// Produces one archive for a BackupConfig: pre-hook, tar(.gz) written under a
// temp name and renamed into place, sidecar checksum, metadata record,
// post-hook. Nothing but the finished triple is ever left in the destination.
class Archiver {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    explicit Archiver(const BackupConfig& config, HookRunner hookRunner = HookRunner());

    // Throws BackupError; partial files are removed before it propagates
    ArchiveResult run(const std::string& backupId,
                      const std::atomic<bool>& cancelled,
                      std::chrono::system_clock::time_point startedAt);

    void setStatusCallback(StatusCallback callback) { statusCallback_ = callback; }

    // <config>_<host>_<YYYYmmdd_HHMMSS>.tar.gz (or .tar)
    static std::string archiveFilename(const BackupConfig& config,
                                       const std::string& host,
                                       std::chrono::system_clock::time_point timestamp);

    // Glob match against the path relative to the source root, matched from
    // the right one component at a time; a leading '/' anchors at the root.
    static bool isExcluded(const std::string& relativePath, const std::vector<std::string>& patterns);

    static std::string lockPath(const BackupConfig& config);

private:
    void validateSource() const;
    uint64_t writeArchive(const std::string& tempPath, const std::atomic<bool>& cancelled);
    void reportStatus(const std::string& status);

    BackupConfig config_;
    HookRunner hookRunner_;
    StatusCallback statusCallback_;
};
