#pragma once

#include "backup/backup_config.hpp"
#include "backup/metadata_store.hpp"
#include "common/backup_status.hpp"
#include <map>
#include <string>
#include <vector>

// Keep/delete split for one config's records
struct RetentionPlan {
    std::vector<BackupMetadata> keep;    // newest first
    std::vector<BackupMetadata> remove;  // newest first
    std::map<std::string, std::vector<std::string>> keepReasons;
    bool belowMinimum{false};
    uint64_t bytesToFree{0};
};

enum class RetentionTier {
    DAILY,
    WEEKLY,
    MONTHLY,
    YEARLY
};

class RetentionEngine {
public:
    explicit RetentionEngine(const std::string& destinationDir);

    // Pure decision: records in any order, result depends only on the inputs.
    // Tiers are evaluated daily, weekly, monthly, yearly; each keeps the newest
    // record of up to N distinct buckets, and a record kept by an earlier tier
    // does not use up a slot. The union is then topped up to min_backups with
    // the newest records not yet kept.
    static RetentionPlan planRetention(std::vector<BackupMetadata> records, const RetentionPolicy& policy);

    // UTC bucket key of a timestamp for a tier, e.g. "2024-03-05", "2024-W10"
    static std::string bucketKey(std::chrono::system_clock::time_point timestamp, RetentionTier tier);
    static std::string tierToString(RetentionTier tier);

    // Plans against a snapshot of the records and, unless dryRun, deletes each
    // removed record's archive, sidecar and metadata. Per-record failures are
    // collected in the stats and do not stop the pass.
    CleanupStats cleanup(const std::string& configName, const RetentionPolicy& policy, bool dryRun);

private:
    void deleteBackup(const BackupMetadata& record);

    MetadataStore store_;
};
