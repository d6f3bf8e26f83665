#include "backup/retention_engine.hpp"
#include "common/checksum.hpp"
#include "common/error.hpp"
#include "common/file_lock.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <set>

namespace {

struct TierQuota {
    RetentionTier tier;
    int count;
};

} // namespace

RetentionEngine::RetentionEngine(const std::string& destinationDir)
    : store_(destinationDir) {
}

std::string RetentionEngine::tierToString(RetentionTier tier) {
    switch (tier) {
        case RetentionTier::DAILY: return "daily";
        case RetentionTier::WEEKLY: return "weekly";
        case RetentionTier::MONTHLY: return "monthly";
        case RetentionTier::YEARLY: return "yearly";
    }
    return "unknown";
}

std::string RetentionEngine::bucketKey(std::chrono::system_clock::time_point timestamp, RetentionTier tier) {
    switch (tier) {
        case RetentionTier::DAILY: return utils::formatUtc(timestamp, "%Y-%m-%d");
        case RetentionTier::WEEKLY: return utils::formatUtc(timestamp, "%G-W%V");
        case RetentionTier::MONTHLY: return utils::formatUtc(timestamp, "%Y-%m");
        case RetentionTier::YEARLY: return utils::formatUtc(timestamp, "%Y");
    }
    return "";
}

RetentionPlan RetentionEngine::planRetention(std::vector<BackupMetadata> records, const RetentionPolicy& policy) {
    validateRetentionPolicy(policy);
    MetadataStore::sortNewestFirst(records);

    RetentionPlan plan;
    std::set<std::string> kept;

    const TierQuota tiers[] = {
        {RetentionTier::DAILY, policy.keepDaily},
        {RetentionTier::WEEKLY, policy.keepWeekly},
        {RetentionTier::MONTHLY, policy.keepMonthly},
        {RetentionTier::YEARLY, policy.keepYearly},
    };

    for (const auto& tier : tiers) {
        int remaining = tier.count;
        std::set<std::string> seenBuckets;
        for (const auto& record : records) {
            if (remaining <= 0) {
                break;
            }
            // First record seen for a bucket is its newest
            if (!seenBuckets.insert(bucketKey(record.createdAt, tier.tier)).second) {
                continue;
            }
            if (kept.count(record.id)) {
                continue;
            }
            kept.insert(record.id);
            plan.keepReasons[record.id].push_back(tierToString(tier.tier));
            --remaining;
        }
    }

    size_t floor = static_cast<size_t>(policy.minBackups);
    for (const auto& record : records) {
        if (kept.size() >= floor) {
            break;
        }
        if (kept.insert(record.id).second) {
            plan.keepReasons[record.id].push_back("min_backups");
        }
    }
    plan.belowMinimum = records.size() < floor;

    for (const auto& record : records) {
        if (kept.count(record.id)) {
            plan.keep.push_back(record);
        } else {
            plan.remove.push_back(record);
            plan.bytesToFree += record.sizeBytes;
        }
    }
    return plan;
}

void RetentionEngine::deleteBackup(const BackupMetadata& record) {
    std::string archive = store_.archivePath(record);

    // Record first: a crash part way leaves an orphaned file, never a record
    // that points at nothing
    store_.remove(record.id);

    std::string sidecar = Checksum::sidecarPath(archive);
    if (!file_utils::removeIfExists(sidecar)) {
        throw BackupError(ErrorCode::IOError, "Failed to remove checksum file " + sidecar);
    }
    if (!file_utils::removeIfExists(archive)) {
        throw BackupError(ErrorCode::IOError, "Failed to remove archive " + archive);
    }
}

CleanupStats RetentionEngine::cleanup(const std::string& configName, const RetentionPolicy& policy, bool dryRun) {
    CleanupStats stats;
    stats.configName = configName;
    stats.dryRun = dryRun;

    std::vector<BackupMetadata> snapshot = store_.list(configName);
    RetentionPlan plan = planRetention(snapshot, policy);

    stats.kept = plan.keep.size();
    stats.belowMinimum = plan.belowMinimum;
    stats.keepReasons = plan.keepReasons;

    Logger::info("Retention for '" + configName + "': " + std::to_string(snapshot.size()) +
                 " backups, keeping " + std::to_string(plan.keep.size()) +
                 ", removing " + std::to_string(plan.remove.size()) + (dryRun ? " (dry run)" : ""));
    if (plan.belowMinimum) {
        Logger::warning("Only " + std::to_string(snapshot.size()) + " backups of '" + configName +
                        "' exist, fewer than min_backups=" + std::to_string(policy.minBackups));
    }

    if (dryRun) {
        stats.deleted = plan.remove.size();
        stats.bytesFreed = plan.bytesToFree;
        for (const auto& record : plan.remove) {
            stats.deletedIds.push_back(record.id);
            Logger::info("Would delete " + record.archiveFilename);
        }
        return stats;
    }

    for (const auto& record : plan.remove) {
        try {
            std::string archive = store_.archivePath(record);
            if (ArchivePin::isPinned(archive)) {
                throw BackupError(ErrorCode::IOError, "archive in use: " + record.archiveFilename);
            }

            // Records may have changed since the snapshot
            size_t live = store_.list(configName).size();
            if (live <= static_cast<size_t>(policy.minBackups)) {
                throw BackupError(ErrorCode::RetentionViolation,
                                  "Deleting " + record.archiveFilename + " would leave fewer than " +
                                  std::to_string(policy.minBackups) + " backups");
            }

            deleteBackup(record);
            stats.deleted++;
            stats.bytesFreed += record.sizeBytes;
            stats.deletedIds.push_back(record.id);
            Logger::info("Deleted backup " + record.archiveFilename + " (" +
                         std::to_string(record.sizeBytes) + " bytes)");
        } catch (const BackupError& e) {
            Logger::error("Failed to delete backup " + record.id + ": " + e.what());
            stats.errors.push_back({record.id, e.code(), e.what()});
            stats.kept++;
        }
    }

    return stats;
}
