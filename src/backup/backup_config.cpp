#include "backup/backup_config.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace {

HookConfig parseHook(const json& j, const std::string& key) {
    HookConfig hook;
    if (!j.contains(key) || j.at(key).is_null()) {
        return hook;
    }

    const json& h = j.at(key);
    if (h.is_string()) {
        hook.command = h.get<std::string>();
        return hook;
    }

    hook.command = h.at("command").get<std::string>();
    auto seconds = h.value("timeout_seconds", static_cast<int64_t>(hook.timeout.count()));
    if (seconds <= 0) {
        throw BackupError(ErrorCode::ConfigError, key + ".timeout_seconds must be positive");
    }
    hook.timeout = std::chrono::seconds(seconds);
    return hook;
}

json hookToJson(const HookConfig& hook) {
    if (!hook.isSet()) {
        return nullptr;
    }
    return json{{"command", hook.command}, {"timeout_seconds", hook.timeout.count()}};
}

} // namespace

void validateRetentionPolicy(const RetentionPolicy& policy) {
    if (policy.keepDaily < 0 || policy.keepWeekly < 0 || policy.keepMonthly < 0 ||
        policy.keepYearly < 0 || policy.minBackups < 0) {
        throw BackupError(ErrorCode::ConfigError, "Retention values must not be negative");
    }
}

void validateBackupConfig(const BackupConfig& config) {
    if (config.name.empty()) {
        throw BackupError(ErrorCode::ConfigError, "Backup config has no name");
    }
    if (config.name.find('/') != std::string::npos || config.name[0] == '.') {
        throw BackupError(ErrorCode::ConfigError, "Invalid backup config name: " + config.name);
    }
    if (config.sourcePath.empty()) {
        throw BackupError(ErrorCode::ConfigError, "Backup config '" + config.name + "' has no source path");
    }
    if (config.destinationDir.empty()) {
        throw BackupError(ErrorCode::ConfigError, "Backup config '" + config.name + "' has no destination");
    }
    if (config.compressionLevel < 1 || config.compressionLevel > 9) {
        throw BackupError(ErrorCode::ConfigError, "Compression level must be between 1 and 9");
    }
    if (config.preHook.isSet() && config.preHook.timeout.count() <= 0) {
        throw BackupError(ErrorCode::ConfigError, "Pre-hook timeout must be positive");
    }
    if (config.postHook.isSet() && config.postHook.timeout.count() <= 0) {
        throw BackupError(ErrorCode::ConfigError, "Post-hook timeout must be positive");
    }
    validateRetentionPolicy(config.retention);
}

BackupConfig parseBackupConfig(const json& j) {
    BackupConfig config;
    try {
        config.name = j.at("name").get<std::string>();
        config.sourcePath = j.at("source").get<std::string>();
        config.destinationDir = j.at("destination").get<std::string>();
        config.compression = j.value("compression", config.compression);
        config.compressionLevel = j.value("compression_level", config.compressionLevel);
        config.enabled = j.value("enabled", config.enabled);
        config.excludePatterns = j.value("exclude", std::vector<std::string>{});
        config.preHook = parseHook(j, "pre_hook");
        config.postHook = parseHook(j, "post_hook");

        if (j.contains("retention")) {
            const json& r = j.at("retention");
            config.retention.keepDaily = r.value("keep_daily", config.retention.keepDaily);
            config.retention.keepWeekly = r.value("keep_weekly", config.retention.keepWeekly);
            config.retention.keepMonthly = r.value("keep_monthly", config.retention.keepMonthly);
            config.retention.keepYearly = r.value("keep_yearly", config.retention.keepYearly);
            config.retention.minBackups = r.value("min_backups", config.retention.minBackups);
        }
    } catch (const json::exception& e) {
        throw BackupError(ErrorCode::ConfigError, std::string("Invalid backup config: ") + e.what());
    }

    validateBackupConfig(config);
    return config;
}

BackupConfig loadBackupConfig(const std::string& path) {
    return selectBackupConfig(loadBackupConfigs(path), "");
}

std::vector<BackupConfig> parseBackupConfigs(const json& j) {
    std::vector<BackupConfig> configs;
    if (!j.is_array()) {
        configs.push_back(parseBackupConfig(j));
        return configs;
    }

    std::set<std::string> names;
    for (const auto& entry : j) {
        BackupConfig config = parseBackupConfig(entry);
        if (!names.insert(config.name).second) {
            throw BackupError(ErrorCode::ConfigError, "Duplicate backup config name: " + config.name);
        }
        configs.push_back(config);
    }
    return configs;
}

std::vector<BackupConfig> loadBackupConfigs(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BackupError(ErrorCode::ConfigError, "Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw BackupError(ErrorCode::ConfigError, "Failed to parse " + path + ": " + e.what());
    }

    auto configs = parseBackupConfigs(j);
    Logger::debug("Loaded " + std::to_string(configs.size()) + " backup config(s) from " + path);
    return configs;
}

BackupConfig selectBackupConfig(const std::vector<BackupConfig>& configs, const std::string& name) {
    if (name.empty()) {
        if (configs.size() != 1) {
            throw BackupError(ErrorCode::ConfigError,
                              "Config file defines " + std::to_string(configs.size()) +
                              " backups; choose one with --name");
        }
        return configs.front();
    }

    for (const auto& config : configs) {
        if (config.name == name) {
            return config;
        }
    }
    throw BackupError(ErrorCode::ConfigError, "No backup config named '" + name + "'");
}

json toJson(const BackupConfig& config) {
    return json{
        {"name", config.name},
        {"source", config.sourcePath},
        {"destination", config.destinationDir},
        {"compression", config.compression},
        {"compression_level", config.compressionLevel},
        {"enabled", config.enabled},
        {"exclude", config.excludePatterns},
        {"pre_hook", hookToJson(config.preHook)},
        {"post_hook", hookToJson(config.postHook)},
        {"retention", {
            {"keep_daily", config.retention.keepDaily},
            {"keep_weekly", config.retention.keepWeekly},
            {"keep_monthly", config.retention.keepMonthly},
            {"keep_yearly", config.retention.keepYearly},
            {"min_backups", config.retention.minBackups}
        }}
    };
}
