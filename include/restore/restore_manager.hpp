#pragma once

#include "common/backup_status.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <sys/types.h>

struct archive;
struct archive_entry;

struct RestoreOptions {
    bool overwrite{false};   // replace existing files instead of failing
    bool bestEffort{false};  // skip and report rejected entries instead of aborting
};

// Extracts a backup archive under a destination root. Every entry is checked
// in a first pass before anything is written; the second pass writes each
// file to a temp sibling and renames it into place. A failed or cancelled
// restore removes whatever it created.
class RestoreManager {
public:
    RestoreManager(const std::string& archivePath,
                   const std::string& destination,
                   RestoreOptions options = RestoreOptions());
    ~RestoreManager();

    // Never throws; failures come back in the outcome
    RestoreOutcome restore(const std::atomic<bool>* cancelled = nullptr);

    // Absolute path an archive member would be written to. Throws
    // BackupError(SecurityError) for absolute names, '..' components, or a
    // location that resolves outside root through an existing symlink.
    static std::string resolveEntryPath(const std::string& root, const std::string& entryName);

    static bool isWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate);

private:
    struct PlannedEntry {
        std::string name;
        std::filesystem::path relative;
        std::filesystem::path target;
        mode_t type{0};
        mode_t perm{0644};
        std::string linkTarget;
        std::string hardlinkName;
        bool hardlink{false};
        time_t mtime{0};
        bool skip{false};
    };

    std::vector<PlannedEntry> scan(RestoreOutcome& outcome);
    void planEntry(struct archive_entry* entry,
                   PlannedEntry& planned,
                   std::set<std::string>& symlinks,
                   std::map<std::string, bool>& plannedTargets);
    void checkLinks(std::vector<PlannedEntry>& plan,
                    const std::set<std::string>& symlinks,
                    RestoreOutcome& outcome);
    void extract(const std::vector<PlannedEntry>& plan, const std::atomic<bool>* cancelled, RestoreOutcome& outcome);
    uint64_t writeFile(struct archive* a, const PlannedEntry& planned, const std::atomic<bool>* cancelled);
    void createDirectories(const std::filesystem::path& dir);
    void removeExisting(const std::filesystem::path& path);
    void rollback();

    std::string archivePath_;
    std::filesystem::path root_;
    RestoreOptions options_;
    std::vector<std::filesystem::path> created_;
    std::string pendingTemp_;
};
