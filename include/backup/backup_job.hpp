#pragma once

#include "common/job.hpp"
#include "backup/archiver.hpp"
#include "backup/backup_config.hpp"
#include "backup/hook_runner.hpp"
#include <string>
#include <vector>
#include <mutex>

// One run of the backup pipeline for a config. The job id doubles as the
// backup id written into the metadata record.
class BackupJob : public Job {
public:
    explicit BackupJob(const BackupConfig& config, HookRunner hookRunner = HookRunner());
    ~BackupJob() override = default;

    bool start() override;

    const BackupConfig& getConfig() const { return config_; }

    // Result accessors; empty until the job has succeeded
    std::string getArchivePath() const;
    BackupMetadata getMetadata() const;
    std::vector<std::string> getWarnings() const;
    double getDurationSeconds() const;

private:
    BackupConfig config_;
    HookRunner hookRunner_;
    ArchiveResult result_;
    mutable std::mutex resultMutex_;
};
