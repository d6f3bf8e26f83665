#include "backup/backup_cli.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const std::set<std::string> kValueOptions = {
    "--config", "--dest", "--name", "--checksum", "--log-file", "--log-level"
};

const std::set<std::string> kFlagOptions = {
    "--json", "--dry-run", "--overwrite", "--best-effort", "-h", "--help"
};

const int kUsageError = 1;

json verificationToJson(const VerificationResult& result) {
    return json{
        {"archive_path", result.archivePath},
        {"is_valid", result.isValid},
        {"checksum_ok", result.checksumOk},
        {"extractable", result.extractable},
        {"checksum_available", result.checksumAvailable},
        {"size_bytes", result.sizeBytes},
        {"entries_count", result.entriesCount},
        {"verified_at", utils::formatIso8601(result.verifiedAt)},
        {"errors", result.errors}
    };
}

void printVerification(const std::string& label, const VerificationResult& result) {
    std::cout << (result.isValid ? "OK      " : "FAILED  ") << label
              << " (checksum: " << (result.checksumOk ? "ok" : "bad")
              << ", extractable: " << (result.extractable ? "yes" : "no")
              << ", entries: " << result.entriesCount << ")\n";
    for (const auto& error : result.errors) {
        std::cout << "        " << error << "\n";
    }
}

} // namespace

BackupCLI::BackupCLI(std::shared_ptr<BackupManager> manager)
    : manager_(manager) {
}

BackupCLI::~BackupCLI() {
}

std::string BackupCLI::Options::value(const std::string& key) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : "";
}

std::string BackupCLI::version() {
    return "1.0.0";
}

void BackupCLI::printUsage() {
    std::cout << "Usage: sysbackup <command> [options]\n"
              << "Commands:\n"
              << "  create --config <file> [--name <config>]      Create a backup\n"
              << "  list (--config <file> | --dest <dir>) [--name <config>] [--json]\n"
              << "                                                List stored backups\n"
              << "  cleanup --config <file> [--name <config>] [--dry-run] [--json]\n"
              << "                                                Apply the retention policy\n"
              << "  verify <archive> [--checksum <hex>] [--json]  Verify one archive\n"
              << "  verify-all --dest <dir> [--json]              Verify every archive in a directory\n"
              << "  restore <archive> <destination> [--overwrite] [--best-effort]\n"
              << "                                                Restore an archive\n"
              << "\n"
              << "Options:\n"
              << "  --log-file <path>    Log file (default /tmp/sysbackup.log)\n"
              << "  --log-level <level>  debug, info, warning, error or fatal\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n";
}

bool BackupCLI::parseOptions(const std::vector<std::string>& args, Options& options, std::string& error) const {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (kValueOptions.count(arg)) {
            if (i + 1 >= args.size()) {
                error = "Option " + arg + " needs a value";
                return false;
            }
            options.values[arg] = args[++i];
        } else if (kFlagOptions.count(arg)) {
            options.flags.insert(arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

bool BackupCLI::initializeLogging(const Options& options) {
    LogLevel level = LogLevel::INFO;
    std::string levelName = options.value("--log-level");
    if (!levelName.empty() && !Logger::parseLevel(levelName, level)) {
        std::cerr << "Error: Unknown log level: " << levelName << std::endl;
        return false;
    }

    if (Logger::isInitialized()) {
        if (!levelName.empty()) {
            Logger::setLogLevel(level);
        }
    } else {
        std::string logFile = options.value("--log-file");
        if (logFile.empty()) {
            logFile = Logger::getLogPath();
        }
        if (!Logger::initialize(logFile, level)) {
            std::cerr << "Error: Failed to initialize logger at " << logFile << std::endl;
            return false;
        }
    }

    Logger::setConsoleOutput(!options.has("--json"));
    return true;
}

bool BackupCLI::loadConfig(const Options& options, BackupConfig& config, int& exitCode) const {
    std::string path = options.value("--config");
    if (path.empty()) {
        std::cerr << "Error: --config is required" << std::endl;
        exitCode = kUsageError;
        return false;
    }

    try {
        config = selectBackupConfig(loadBackupConfigs(path), options.value("--name"));
        return true;
    } catch (const BackupError& e) {
        Logger::error("Failed to load config " + path + ": " + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = exitCodeFor(e.code());
        return false;
    }
}

int BackupCLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(args);
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return kUsageError;
    }

    const std::string& command = args[0];
    if (command == "-h" || command == "--help") {
        printUsage();
        return 0;
    }
    if (command == "--version") {
        std::cout << "sysbackup version " << version() << "\n";
        return 0;
    }

    Options options;
    std::string error;
    if (!parseOptions(std::vector<std::string>(args.begin() + 1, args.end()), options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printUsage();
        return kUsageError;
    }
    if (options.has("-h") || options.has("--help")) {
        printUsage();
        return 0;
    }
    if (!initializeLogging(options)) {
        return kUsageError;
    }

    manager_->clearLastError();
    Logger::debug("Running command: " + command);

    if (command == "create") {
        return handleCreateCommand(options);
    } else if (command == "list") {
        return handleListCommand(options);
    } else if (command == "cleanup") {
        return handleCleanupCommand(options);
    } else if (command == "verify") {
        return handleVerifyCommand(options);
    } else if (command == "verify-all") {
        return handleVerifyAllCommand(options);
    } else if (command == "restore") {
        return handleRestoreCommand(options);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    Logger::error("Unknown command: " + command);
    printUsage();
    return kUsageError;
}

int BackupCLI::handleCreateCommand(const Options& options) {
    BackupConfig config;
    int exitCode = 0;
    if (!loadConfig(options, config, exitCode)) {
        return exitCode;
    }

    auto job = manager_->createBackup(config);
    if (!job->isSucceeded()) {
        std::cerr << "Backup failed (" << errorCodeToString(job->getErrorCode()) << "): "
                  << job->getError() << std::endl;
        return exitCodeFor(job->getErrorCode());
    }

    BackupMetadata metadata = job->getMetadata();
    if (options.has("--json")) {
        json j = metadata;
        j["archive_path"] = job->getArchivePath();
        j["duration_seconds"] = job->getDurationSeconds();
        j["warnings"] = job->getWarnings();
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << "Backup created: " << job->getArchivePath() << "\n"
                  << "  id:       " << metadata.id << "\n"
                  << "  size:     " << metadata.sizeBytes << " bytes\n"
                  << "  files:    " << metadata.filesCount << "\n"
                  << "  checksum: " << metadata.checksum << "\n"
                  << "  duration: " << std::fixed << std::setprecision(2) << job->getDurationSeconds() << "s\n";
        for (const auto& warning : job->getWarnings()) {
            std::cout << "Warning: " << warning << "\n";
        }
    }
    return 0;
}

int BackupCLI::handleListCommand(const Options& options) {
    std::string destination = options.value("--dest");
    std::string name = options.value("--name");

    if (!options.value("--config").empty()) {
        BackupConfig config;
        int exitCode = 0;
        if (!loadConfig(options, config, exitCode)) {
            return exitCode;
        }
        destination = config.destinationDir;
        name = config.name;
    }
    if (destination.empty()) {
        std::cerr << "Error: list needs --config or --dest" << std::endl;
        return kUsageError;
    }

    std::vector<BackupMetadata> records = manager_->listBackups(destination, name);
    if (manager_->getLastErrorCode() != ErrorCode::None) {
        std::cerr << "Error: " << manager_->getLastError() << std::endl;
        return exitCodeFor(manager_->getLastErrorCode());
    }

    if (options.has("--json")) {
        std::cout << json(records).dump(2) << std::endl;
        return 0;
    }

    if (records.empty()) {
        std::cout << "No backups found in " << destination << "\n";
        return 0;
    }

    std::cout << std::left << std::setw(26) << "ID"
              << std::setw(22) << "CREATED"
              << std::setw(16) << "CONFIG"
              << std::setw(14) << "SIZE"
              << "ARCHIVE\n";
    for (const auto& record : records) {
        std::cout << std::left << std::setw(26) << record.id
                  << std::setw(22) << utils::formatIso8601(record.createdAt)
                  << std::setw(16) << record.configName
                  << std::setw(14) << record.sizeBytes
                  << record.archiveFilename << "\n";
    }
    return 0;
}

int BackupCLI::handleCleanupCommand(const Options& options) {
    BackupConfig config;
    int exitCode = 0;
    if (!loadConfig(options, config, exitCode)) {
        return exitCode;
    }

    CleanupStats stats = manager_->cleanup(config, options.has("--dry-run"));

    if (options.has("--json")) {
        json errors = json::array();
        for (const auto& error : stats.errors) {
            errors.push_back({{"backup_id", error.backupId},
                              {"code", errorCodeToString(error.code)},
                              {"message", error.message}});
        }
        json j = {
            {"config_name", stats.configName},
            {"dry_run", stats.dryRun},
            {"kept", stats.kept},
            {"deleted", stats.deleted},
            {"bytes_freed", stats.bytesFreed},
            {"below_minimum", stats.belowMinimum},
            {"deleted_ids", stats.deletedIds},
            {"keep_reasons", stats.keepReasons},
            {"errors", errors}
        };
        std::cout << j.dump(2) << std::endl;
    } else {
        std::string verb = stats.dryRun ? "Would delete " : "Deleted ";
        std::cout << "Cleanup of '" << stats.configName << "'" << (stats.dryRun ? " (dry run)" : "") << "\n"
                  << "  kept:    " << stats.kept << "\n"
                  << "  " << (stats.dryRun ? "to delete: " : "deleted: ") << stats.deleted << "\n"
                  << "  " << (stats.dryRun ? "to free:   " : "freed:   ") << stats.bytesFreed << " bytes\n";
        for (const auto& id : stats.deletedIds) {
            std::cout << "  " << verb << id << "\n";
        }
        if (stats.belowMinimum) {
            std::cout << "Warning: fewer backups exist than min_backups=" << config.retention.minBackups << "\n";
        }
        for (const auto& error : stats.errors) {
            std::cerr << "Error: " << (error.backupId.empty() ? "" : error.backupId + ": ") << error.message << std::endl;
        }
    }

    return stats.errors.empty() ? 0 : exitCodeFor(stats.errors.front().code);
}

int BackupCLI::handleVerifyCommand(const Options& options) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: verify takes exactly one archive path" << std::endl;
        return kUsageError;
    }

    const std::string& archive = options.positional[0];
    std::error_code ec;
    bool exists = std::filesystem::is_regular_file(archive, ec);

    VerificationResult result = manager_->verify(archive, options.value("--checksum"));
    if (options.has("--json")) {
        std::cout << verificationToJson(result).dump(2) << std::endl;
    } else {
        printVerification(archive, result);
    }

    if (result.isValid) {
        return 0;
    }
    return exitCodeFor(exists ? ErrorCode::IntegrityError : ErrorCode::IOError);
}

int BackupCLI::handleVerifyAllCommand(const Options& options) {
    std::string destination = options.value("--dest");
    if (destination.empty()) {
        std::cerr << "Error: verify-all needs --dest" << std::endl;
        return kUsageError;
    }

    auto results = manager_->verifyAll(destination);
    if (manager_->getLastErrorCode() == ErrorCode::IOError) {
        std::cerr << "Error: " << manager_->getLastError() << std::endl;
        return exitCodeFor(ErrorCode::IOError);
    }

    bool allValid = true;
    json j = json::object();
    for (const auto& pair : results) {
        allValid = allValid && pair.second.isValid;
        if (options.has("--json")) {
            j[pair.first] = verificationToJson(pair.second);
        } else {
            printVerification(pair.first, pair.second);
        }
    }

    if (options.has("--json")) {
        std::cout << j.dump(2) << std::endl;
    } else if (results.empty()) {
        std::cout << "No archives found in " << destination << "\n";
    }
    return allValid ? 0 : exitCodeFor(ErrorCode::IntegrityError);
}

int BackupCLI::handleRestoreCommand(const Options& options) {
    if (options.positional.size() != 2) {
        std::cerr << "Error: restore takes an archive path and a destination" << std::endl;
        return kUsageError;
    }

    RestoreOptions restoreOptions;
    restoreOptions.overwrite = options.has("--overwrite");
    restoreOptions.bestEffort = options.has("--best-effort");

    RestoreOutcome outcome = manager_->restore(options.positional[0], options.positional[1], restoreOptions);

    for (const auto& skipped : outcome.skippedEntries) {
        std::cerr << "Skipped: " << skipped << std::endl;
    }
    if (!outcome.success) {
        std::cerr << "Restore failed (" << errorCodeToString(outcome.errorCode) << "): " << outcome.error << std::endl;
        return exitCodeFor(outcome.errorCode);
    }

    std::cout << "Restored " << outcome.entriesWritten << " entries (" << outcome.bytesWritten
              << " bytes) to " << options.positional[1] << "\n";
    return 0;
}
