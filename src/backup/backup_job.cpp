#include "backup/backup_job.hpp"
#include "common/logger.hpp"
#include <chrono>

BackupJob::BackupJob(const BackupConfig& config, HookRunner hookRunner)
    : config_(config)
    , hookRunner_(hookRunner) {
    setId(generateId());
}

bool BackupJob::start() {
    if (!begin()) {
        Logger::warning("Backup job " + getId() + " has already been started");
        return false;
    }

    Logger::info("Starting backup job " + getId() + " for '" + config_.name + "'");

    try {
        Archiver archiver(config_, hookRunner_);
        archiver.setStatusCallback([this](const std::string& status) { setStatus(status); });

        ArchiveResult result = archiver.run(getId(), cancelFlag(), getStartTime());
        {
            std::lock_guard<std::mutex> lock(resultMutex_);
            result_ = result;
        }
        succeed();
        Logger::info("Backup job " + getId() + " completed in " +
                     std::to_string(getDurationSeconds()) + "s");
        return true;
    } catch (const BackupError& e) {
        Logger::error("Backup job " + getId() + " failed (" + errorCodeToString(e.code()) + "): " + e.what());
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        Logger::error("Backup job " + getId() + " failed: " + e.what());
        fail(ErrorCode::IOError, e.what());
    }
    return false;
}

std::string BackupJob::getArchivePath() const {
    std::lock_guard<std::mutex> lock(resultMutex_);
    return result_.archivePath;
}

BackupMetadata BackupJob::getMetadata() const {
    std::lock_guard<std::mutex> lock(resultMutex_);
    return result_.metadata;
}

std::vector<std::string> BackupJob::getWarnings() const {
    std::lock_guard<std::mutex> lock(resultMutex_);
    return result_.warnings;
}

double BackupJob::getDurationSeconds() const {
    if (!isFinished()) {
        return 0.0;
    }
    std::chrono::duration<double> elapsed = getEndTime() - getStartTime();
    return elapsed.count();
}
