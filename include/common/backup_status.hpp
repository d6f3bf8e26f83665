#pragma once

#include "common/error.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

// Durable record of one succeeded backup
struct BackupMetadata {
    std::string id;
    std::chrono::system_clock::time_point createdAt;
    std::string configName;
    std::string archiveFilename;
    uint64_t sizeBytes{0};
    std::string checksum;
    std::string hostname;
    std::string sourcePath;
    uint64_t filesCount{0};
    bool compressed{true};
};

void to_json(nlohmann::json& j, const BackupMetadata& metadata);
void from_json(const nlohmann::json& j, BackupMetadata& metadata);

// A bare file name inside the destination directory: no separators, not "." or ".."
bool isPlainArchiveFilename(const std::string& name);

struct VerificationResult {
    std::string archivePath;
    bool isValid{false};
    bool checksumOk{false};
    bool extractable{false};
    bool checksumAvailable{false};
    uint64_t sizeBytes{0};
    uint64_t entriesCount{0};
    std::chrono::system_clock::time_point verifiedAt;
    std::vector<std::string> errors;
};

struct RestoreOutcome {
    bool success{false};
    ErrorCode errorCode{ErrorCode::None};
    std::string error;
    uint64_t entriesWritten{0};
    uint64_t bytesWritten{0};
    std::vector<std::string> skippedEntries;
};

struct CleanupError {
    std::string backupId;
    ErrorCode code{ErrorCode::None};
    std::string message;
};

struct CleanupStats {
    std::string configName;
    bool dryRun{false};
    size_t kept{0};
    size_t deleted{0};          // would-delete in dry-run mode
    uint64_t bytesFreed{0};     // would-free in dry-run mode
    bool belowMinimum{false};   // fewer records exist than min_backups
    std::vector<std::string> deletedIds;
    std::map<std::string, std::vector<std::string>> keepReasons;  // id -> tiers
    std::vector<CleanupError> errors;
};
