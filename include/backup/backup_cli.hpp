#pragma once

#include "backup/backup_manager.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Command line front end. run() returns the process exit code.
class BackupCLI {
public:
    explicit BackupCLI(std::shared_ptr<BackupManager> manager);
    ~BackupCLI();

    int run(int argc, char* argv[]);
    int run(const std::vector<std::string>& args);

    static void printUsage();
    static std::string version();

private:
    struct Options {
        std::vector<std::string> positional;
        std::map<std::string, std::string> values;
        std::set<std::string> flags;

        bool has(const std::string& flag) const { return flags.count(flag) > 0; }
        std::string value(const std::string& key) const;
    };

    bool parseOptions(const std::vector<std::string>& args, Options& options, std::string& error) const;
    bool initializeLogging(const Options& options);
    bool loadConfig(const Options& options, BackupConfig& config, int& exitCode) const;

    int handleCreateCommand(const Options& options);
    int handleListCommand(const Options& options);
    int handleCleanupCommand(const Options& options);
    int handleVerifyCommand(const Options& options);
    int handleVerifyAllCommand(const Options& options);
    int handleRestoreCommand(const Options& options);

    std::shared_ptr<BackupManager> manager_;
};
