#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

// External command run before or after a backup
struct HookConfig {
    std::string command;
    std::chrono::seconds timeout{300};

    bool isSet() const { return !command.empty(); }
};

// "Keep the newest N per bucket" for each tier, and a floor on the total
struct RetentionPolicy {
    int keepDaily = 7;
    int keepWeekly = 4;
    int keepMonthly = 6;
    int keepYearly = 1;
    int minBackups = 3;
};

struct BackupConfig {
    std::string name;
    std::string sourcePath;
    std::string destinationDir;
    bool compression = true;
    int compressionLevel = 6;  // gzip 1..9
    bool enabled = true;
    std::vector<std::string> excludePatterns;
    HookConfig preHook;
    HookConfig postHook;
    RetentionPolicy retention;
};

// Throws BackupError(ConfigError) describing the first problem found
void validateRetentionPolicy(const RetentionPolicy& policy);
void validateBackupConfig(const BackupConfig& config);

BackupConfig parseBackupConfig(const nlohmann::json& j);
BackupConfig loadBackupConfig(const std::string& path);

// A config file holds one object or an array of them; names must be unique
std::vector<BackupConfig> parseBackupConfigs(const nlohmann::json& j);
std::vector<BackupConfig> loadBackupConfigs(const std::string& path);

// Pick one config by name; an empty name is accepted only for single-entry lists
BackupConfig selectBackupConfig(const std::vector<BackupConfig>& configs, const std::string& name);

nlohmann::json toJson(const BackupConfig& config);
