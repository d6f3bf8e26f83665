#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/hook_runner.hpp"
#include "common/backup_status.hpp"
#include "restore/restore_manager.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Entry point for the lifecycle operations: create, list, cleanup, verify and
// restore. Operations report failures in their result objects; the last
// failure is also kept here for callers that only need a message.
class BackupManager {
public:
    explicit BackupManager(HookRunner hookRunner = HookRunner());
    ~BackupManager();

    // Runs a backup to completion on the calling thread
    std::shared_ptr<BackupJob> createBackup(const BackupConfig& config);

    std::vector<BackupMetadata> listBackups(const std::string& destinationDir,
                                            const std::string& configName = "");
    CleanupStats cleanup(const BackupConfig& config, bool dryRun);
    VerificationResult verify(const std::string& archivePath, const std::string& expectedChecksum = "");
    std::map<std::string, VerificationResult> verifyAll(const std::string& directory);
    RestoreOutcome restore(const std::string& archivePath,
                           const std::string& destination,
                           const RestoreOptions& options = RestoreOptions(),
                           const std::atomic<bool>* cancelled = nullptr);

    // Job management
    std::shared_ptr<BackupJob> createBackupJob(const BackupConfig& config);
    std::vector<std::shared_ptr<BackupJob>> getBackupJobs() const;
    std::shared_ptr<BackupJob> getBackupJob(const std::string& jobId) const;
    bool cancelBackup(const std::string& jobId);
    bool removeBackupJob(const std::string& jobId);

    void setStatusCallback(StatusCallback callback);

    // Error handling
    std::string getLastError() const;
    ErrorCode getLastErrorCode() const;
    void clearLastError();

private:
    void setLastError(ErrorCode code, const std::string& error);

    HookRunner hookRunner_;
    std::unordered_map<std::string, std::shared_ptr<BackupJob>> jobs_;
    std::string lastError_;
    ErrorCode lastErrorCode_{ErrorCode::None};
    StatusCallback statusCallback_;
    mutable std::mutex mutex_;
};
