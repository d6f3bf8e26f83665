#include "backup/backup_manager.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/metadata_store.hpp"
#include "backup/retention_engine.hpp"
#include "common/logger.hpp"

BackupManager::BackupManager(HookRunner hookRunner)
    : hookRunner_(hookRunner) {
}

BackupManager::~BackupManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
}

std::shared_ptr<BackupJob> BackupManager::createBackupJob(const BackupConfig& config) {
    auto job = std::make_shared<BackupJob>(config, hookRunner_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (statusCallback_) {
        job->setStatusCallback(statusCallback_);
    }
    jobs_[job->getId()] = job;
    return job;
}

std::shared_ptr<BackupJob> BackupManager::createBackup(const BackupConfig& config) {
    auto job = createBackupJob(config);
    if (!job->start()) {
        setLastError(job->getErrorCode(), job->getError());
    }
    return job;
}

std::vector<std::shared_ptr<BackupJob>> BackupManager::getBackupJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BackupJob>> result;
    result.reserve(jobs_.size());
    for (const auto& pair : jobs_) {
        result.push_back(pair.second);
    }
    return result;
}

std::shared_ptr<BackupJob> BackupManager::getBackupJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    return it != jobs_.end() ? it->second : nullptr;
}

bool BackupManager::cancelBackup(const std::string& jobId) {
    auto job = getBackupJob(jobId);
    if (!job || job->isFinished()) {
        setLastError(ErrorCode::ConfigError, "No running backup job " + jobId);
        return false;
    }
    job->cancel();
    return true;
}

bool BackupManager::removeBackupJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it != jobs_.end()) {
        jobs_.erase(it);
        return true;
    }
    return false;
}

std::vector<BackupMetadata> BackupManager::listBackups(const std::string& destinationDir,
                                                       const std::string& configName) {
    try {
        return MetadataStore(destinationDir).list(configName);
    } catch (const BackupError& e) {
        Logger::error("Failed to list backups in " + destinationDir + ": " + e.what());
        setLastError(e.code(), e.what());
    }
    return {};
}

CleanupStats BackupManager::cleanup(const BackupConfig& config, bool dryRun) {
    try {
        return RetentionEngine(config.destinationDir).cleanup(config.name, config.retention, dryRun);
    } catch (const BackupError& e) {
        Logger::error("Cleanup of '" + config.name + "' failed: " + e.what());
        setLastError(e.code(), e.what());

        CleanupStats stats;
        stats.configName = config.name;
        stats.dryRun = dryRun;
        stats.errors.push_back({"", e.code(), e.what()});
        return stats;
    }
}

VerificationResult BackupManager::verify(const std::string& archivePath, const std::string& expectedChecksum) {
    VerificationResult result = BackupVerifier(archivePath, expectedChecksum).verify();
    if (!result.isValid && !result.errors.empty()) {
        setLastError(ErrorCode::IntegrityError, result.errors.front());
    }
    return result;
}

std::map<std::string, VerificationResult> BackupManager::verifyAll(const std::string& directory) {
    try {
        return BackupVerifier::verifyAll(directory);
    } catch (const BackupError& e) {
        Logger::error("Failed to verify backups in " + directory + ": " + e.what());
        setLastError(e.code(), e.what());
    }
    return {};
}

RestoreOutcome BackupManager::restore(const std::string& archivePath,
                                      const std::string& destination,
                                      const RestoreOptions& options,
                                      const std::atomic<bool>* cancelled) {
    RestoreOutcome outcome = RestoreManager(archivePath, destination, options).restore(cancelled);
    if (!outcome.success) {
        setLastError(outcome.errorCode, outcome.error);
    }
    return outcome;
}

void BackupManager::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusCallback_ = callback;
}

void BackupManager::setLastError(ErrorCode code, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastErrorCode_ = code;
    lastError_ = error;
}

std::string BackupManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

ErrorCode BackupManager::getLastErrorCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastErrorCode_;
}

void BackupManager::clearLastError() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_.clear();
    lastErrorCode_ = ErrorCode::None;
}
